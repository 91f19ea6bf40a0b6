#include "json.hpp"

#include <iostream>
#include <string>

using namespace veriloop::lib;

namespace
{

    int fail(const std::string &message)
    {
        std::cerr << "[json-tests] " << message << '\n';
        return 1;
    }

} // namespace

int main()
{
    // Nested document with escapes
    {
        const json::JsonValue root =
            json::parse(R"({"a": [1, 2.5, true, null], "s": "x\"y\nA", "o": {"k": -7}})");
        if (!root.isObject())
        {
            return fail("root is not an object");
        }
        const json::JsonValue *a = root.find("a");
        if (!a || !a->isArray() || a->asArray("a").size() != 4)
        {
            return fail("array member not parsed");
        }
        const auto &items = a->asArray("a");
        if (items[0].asInt("a[0]") != 1 || items[1].asDouble("a[1]") != 2.5 || !items[2].asBool("a[2]") ||
            !items[3].isNull())
        {
            return fail("array element values differ");
        }
        if (root.find("s")->asString("s") != "x\"y\nA")
        {
            return fail("string escapes decoded incorrectly: " + root.find("s")->asString("s"));
        }
        if (root.find("o")->find("k")->asInt("o.k") != -7)
        {
            return fail("negative integer lost");
        }
    }

    // Malformed input is a JsonError
    {
        for (const char *text : {"{\"a\": }", "{\"a\": 1} trailing", "[1, 2", "\"unterminated"})
        {
            try
            {
                (void)json::parse(text);
                return fail(std::string("malformed input accepted: ") + text);
            }
            catch (const json::JsonError &)
            {
            }
        }
    }

    // Typed accessors reject the wrong kind
    {
        const json::JsonValue root = json::parse(R"({"n": 1.5})");
        try
        {
            (void)root.find("n")->asInt("n");
            return fail("fractional number accepted as integer");
        }
        catch (const json::JsonError &ex)
        {
            if (std::string(ex.what()).find("n:") != 0)
            {
                return fail(std::string("error lacks context: ") + ex.what());
            }
        }
    }

    // Field paths used for backend replies
    {
        const json::JsonValue root =
            json::parse(R"({"choices": [{"message": {"content": "module m; endmodule"}}]})");
        const json::JsonValue *content = json::resolvePath(root, "choices[0].message.content");
        if (!content || content->asString("content") != "module m; endmodule")
        {
            return fail("resolvePath did not reach choices[0].message.content");
        }
        if (json::resolvePath(root, "choices[1].message") != nullptr)
        {
            return fail("out-of-range index resolved");
        }
        if (json::resolvePath(root, "missing.field") != nullptr)
        {
            return fail("missing key resolved");
        }
    }

    // Object located inside chatty model output
    {
        const std::string reply = "Here is the plan:\n```json\n{\"modules\": []}\n```\nHope this helps {not json}";
        const auto located = json::locateDocument(reply);
        if (!located || *located != "{\"modules\": []}")
        {
            return fail("fenced JSON object not located");
        }
        const auto bare = json::locateDocument("prefix {\"a\": {\"b\": 1}} suffix");
        if (!bare || *bare != "{\"a\": {\"b\": 1}}")
        {
            return fail("bare JSON object not located");
        }
        if (json::locateDocument("no braces here"))
        {
            return fail("object located in text without braces");
        }

        const auto trailing = json::locateDocument("{\"modules\": [{\"name\": \"x}\"}]}\n"
                                                   "Note: outputs are grouped as {carry, sum}.");
        if (!trailing || *trailing != "{\"modules\": [{\"name\": \"x}\"}]}")
        {
            return fail("trailing braces in prose extended the document");
        }
        const auto leading = json::locateDocument("Drive a[3] and {carry, sum} from:\n{\"modules\": []}");
        if (!leading || *leading != "{\"modules\": []}")
        {
            return fail("braces in leading prose taken as the document");
        }
        const auto array = json::locateDocument("[{\"name\": \"top\"}] done");
        if (!array || *array != "[{\"name\": \"top\"}]")
        {
            return fail("top-level array not located");
        }
        const auto broken = json::locateDocument("{\"modules\": [1,]}");
        if (!broken || *broken != "{\"modules\": [1,]}")
        {
            return fail("unparsable span not handed back for error reporting");
        }
    }

    return 0;
}
