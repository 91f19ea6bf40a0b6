#ifndef VERILOOP_JSON_HPP
#define VERILOOP_JSON_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace veriloop::lib::json
{

    class JsonError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    struct JsonValue
    {
        using Array = std::vector<JsonValue>;
        using Object = std::map<std::string, JsonValue, std::less<>>;

        std::variant<std::nullptr_t, bool, int64_t, double, std::string, Array, Object> value;

        bool isNull() const { return std::holds_alternative<std::nullptr_t>(value); }
        bool isBool() const { return std::holds_alternative<bool>(value); }
        bool isInt() const { return std::holds_alternative<int64_t>(value); }
        bool isDouble() const { return std::holds_alternative<double>(value); }
        bool isNumber() const { return isInt() || isDouble(); }
        bool isString() const { return std::holds_alternative<std::string>(value); }
        bool isArray() const { return std::holds_alternative<Array>(value); }
        bool isObject() const { return std::holds_alternative<Object>(value); }

        bool asBool(std::string_view ctx) const;
        int64_t asInt(std::string_view ctx) const;
        double asDouble(std::string_view ctx) const;
        const std::string &asString(std::string_view ctx) const;
        const Array &asArray(std::string_view ctx) const;
        const Object &asObject(std::string_view ctx) const;

        // Member lookup; nullptr when this is not an object or the key is absent.
        const JsonValue *find(std::string_view key) const;
    };

    JsonValue parse(std::string_view text);

    // Walks a path such as "choices[0].message.content".
    const JsonValue *resolvePath(const JsonValue &root, std::string_view path);

    // Locates a JSON document inside free text (inside the ```json fenced block if present):
    // the first balanced object, or array of objects, that parses. When none parses, the first balanced
    // span is returned so the caller reports the parse error.
    std::optional<std::string_view> locateDocument(std::string_view text);

} // namespace veriloop::lib::json

#endif // VERILOOP_JSON_HPP
