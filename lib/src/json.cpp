#include "json.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <system_error>
#include <utility>
#include <vector>

namespace veriloop::lib::json
{

    namespace
    {

        class JsonParser
        {
        public:
            explicit JsonParser(std::string_view text) : text_(text), current_(text_.data()), end_(text_.data() + text_.size()) {}

            JsonValue parse()
            {
                skipWhitespace();
                JsonValue value = parseValue(0);
                skipWhitespace();
                if (current_ != end_)
                {
                    fail("Trailing characters after JSON document");
                }
                return value;
            }

        private:
            static constexpr int kMaxDepth = 256;

            [[noreturn]] void fail(std::string_view message) const
            {
                std::string text(message);
                text.append(" at offset ");
                text.append(std::to_string(static_cast<std::size_t>(current_ - text_.data())));
                throw JsonError(text);
            }

            JsonValue parseValue(int depth)
            {
                if (current_ == end_)
                {
                    fail("Unexpected end of JSON input");
                }
                if (depth > kMaxDepth)
                {
                    fail("JSON nesting too deep");
                }

                switch (*current_)
                {
                case '{':
                    return parseObject(depth);
                case '[':
                    return parseArray(depth);
                case '"':
                    return JsonValue{parseString()};
                case 't':
                    return JsonValue{parseLiteral("true", true)};
                case 'f':
                    return JsonValue{parseLiteral("false", false)};
                case 'n':
                    parseLiteral("null");
                    return JsonValue{std::nullptr_t{}};
                default:
                    if (*current_ == '-' || std::isdigit(static_cast<unsigned char>(*current_)))
                    {
                        return parseNumber();
                    }
                    break;
                }

                fail("Invalid JSON value");
            }

            JsonValue parseObject(int depth)
            {
                JsonValue::Object obj;
                expect('{');
                skipWhitespace();
                if (consume('}'))
                {
                    return JsonValue{std::move(obj)};
                }

                while (true)
                {
                    skipWhitespace();
                    std::string key = parseString();
                    skipWhitespace();
                    expect(':');
                    skipWhitespace();
                    obj.insert_or_assign(std::move(key), parseValue(depth + 1));
                    skipWhitespace();
                    if (consume('}'))
                    {
                        break;
                    }
                    expect(',');
                }

                return JsonValue{std::move(obj)};
            }

            JsonValue parseArray(int depth)
            {
                JsonValue::Array arr;
                expect('[');
                skipWhitespace();
                if (consume(']'))
                {
                    return JsonValue{std::move(arr)};
                }

                while (true)
                {
                    skipWhitespace();
                    arr.push_back(parseValue(depth + 1));
                    skipWhitespace();
                    if (consume(']'))
                    {
                        break;
                    }
                    expect(',');
                }

                return JsonValue{std::move(arr)};
            }

            void skipDigits()
            {
                while (current_ != end_ && std::isdigit(static_cast<unsigned char>(*current_)))
                {
                    ++current_;
                }
            }

            JsonValue parseNumber()
            {
                const char *start = current_;
                if (*current_ == '-')
                {
                    ++current_;
                }
                if (current_ == end_)
                {
                    fail("Invalid JSON number");
                }
                if (*current_ == '0')
                {
                    ++current_;
                }
                else
                {
                    if (!std::isdigit(static_cast<unsigned char>(*current_)))
                    {
                        fail("Invalid JSON number");
                    }
                    skipDigits();
                }

                bool isFloat = false;
                if (current_ != end_ && *current_ == '.')
                {
                    isFloat = true;
                    ++current_;
                    if (current_ == end_ || !std::isdigit(static_cast<unsigned char>(*current_)))
                    {
                        fail("Invalid JSON number");
                    }
                    skipDigits();
                }

                if (current_ != end_ && (*current_ == 'e' || *current_ == 'E'))
                {
                    isFloat = true;
                    ++current_;
                    if (current_ != end_ && (*current_ == '+' || *current_ == '-'))
                    {
                        ++current_;
                    }
                    if (current_ == end_ || !std::isdigit(static_cast<unsigned char>(*current_)))
                    {
                        fail("Invalid JSON number");
                    }
                    skipDigits();
                }

                std::string_view numberView(start, static_cast<std::size_t>(current_ - start));
                if (isFloat)
                {
                    double value = 0.0;
                    auto [ptr, ec] = std::from_chars(numberView.data(), numberView.data() + numberView.size(), value);
                    if (ec != std::errc())
                    {
                        fail("Invalid JSON number");
                    }
                    return JsonValue{value};
                }

                int64_t intValue = 0;
                auto [ptr, ec] = std::from_chars(numberView.data(), numberView.data() + numberView.size(), intValue);
                if (ec == std::errc::result_out_of_range)
                {
                    double value = 0.0;
                    auto [dptr, dec] = std::from_chars(numberView.data(), numberView.data() + numberView.size(), value);
                    if (dec != std::errc())
                    {
                        fail("Invalid JSON number");
                    }
                    return JsonValue{value};
                }
                if (ec != std::errc())
                {
                    fail("Invalid JSON number");
                }
                return JsonValue{intValue};
            }

            static void appendUtf8(std::string &out, unsigned value)
            {
                if (value <= 0x7F)
                {
                    out.push_back(static_cast<char>(value));
                }
                else if (value <= 0x7FF)
                {
                    out.push_back(static_cast<char>(0xC0 | ((value >> 6) & 0x1F)));
                    out.push_back(static_cast<char>(0x80 | (value & 0x3F)));
                }
                else if (value <= 0xFFFF)
                {
                    out.push_back(static_cast<char>(0xE0 | ((value >> 12) & 0x0F)));
                    out.push_back(static_cast<char>(0x80 | ((value >> 6) & 0x3F)));
                    out.push_back(static_cast<char>(0x80 | (value & 0x3F)));
                }
                else
                {
                    out.push_back(static_cast<char>(0xF0 | ((value >> 18) & 0x07)));
                    out.push_back(static_cast<char>(0x80 | ((value >> 12) & 0x3F)));
                    out.push_back(static_cast<char>(0x80 | ((value >> 6) & 0x3F)));
                    out.push_back(static_cast<char>(0x80 | (value & 0x3F)));
                }
            }

            unsigned parseHex4()
            {
                if (end_ - current_ < 4)
                {
                    fail("Invalid unicode escape");
                }
                unsigned value = 0;
                for (int i = 0; i < 4; ++i)
                {
                    char hex = *current_++;
                    value <<= 4;
                    if (hex >= '0' && hex <= '9')
                    {
                        value |= static_cast<unsigned>(hex - '0');
                    }
                    else if (hex >= 'a' && hex <= 'f')
                    {
                        value |= static_cast<unsigned>(hex - 'a' + 10);
                    }
                    else if (hex >= 'A' && hex <= 'F')
                    {
                        value |= static_cast<unsigned>(hex - 'A' + 10);
                    }
                    else
                    {
                        fail("Invalid unicode escape");
                    }
                }
                return value;
            }

            std::string parseString()
            {
                expect('"');
                std::string result;
                while (true)
                {
                    if (current_ == end_)
                    {
                        fail("Unterminated JSON string");
                    }
                    char ch = *current_++;
                    if (ch == '"')
                    {
                        break;
                    }
                    if (ch != '\\')
                    {
                        result.push_back(ch);
                        continue;
                    }
                    if (current_ == end_)
                    {
                        fail("Invalid escape sequence");
                    }

                    char esc = *current_++;
                    switch (esc)
                    {
                    case '"':
                    case '\\':
                    case '/':
                        result.push_back(esc);
                        break;
                    case 'b':
                        result.push_back('\b');
                        break;
                    case 'f':
                        result.push_back('\f');
                        break;
                    case 'n':
                        result.push_back('\n');
                        break;
                    case 'r':
                        result.push_back('\r');
                        break;
                    case 't':
                        result.push_back('\t');
                        break;
                    case 'u':
                    {
                        unsigned value = parseHex4();
                        // Surrogate pair.
                        if (value >= 0xD800 && value <= 0xDBFF && end_ - current_ >= 6 && current_[0] == '\\' && current_[1] == 'u')
                        {
                            current_ += 2;
                            const unsigned low = parseHex4();
                            if (low >= 0xDC00 && low <= 0xDFFF)
                            {
                                value = 0x10000 + ((value - 0xD800) << 10) + (low - 0xDC00);
                            }
                        }
                        appendUtf8(result, value);
                        break;
                    }
                    default:
                        fail("Invalid escape sequence");
                    }
                }
                return result;
            }

            bool parseLiteral(std::string_view literal, bool value)
            {
                parseLiteral(literal);
                return value;
            }

            void parseLiteral(std::string_view literal)
            {
                for (char expected : literal)
                {
                    if (current_ == end_ || *current_++ != expected)
                    {
                        fail("Invalid JSON literal");
                    }
                }
            }

            void skipWhitespace()
            {
                while (current_ != end_ && std::isspace(static_cast<unsigned char>(*current_)))
                {
                    ++current_;
                }
            }

            bool consume(char ch)
            {
                if (current_ != end_ && *current_ == ch)
                {
                    ++current_;
                    return true;
                }
                return false;
            }

            void expect(char ch)
            {
                if (current_ == end_ || *current_ != ch)
                {
                    fail("Unexpected character in JSON stream");
                }
                ++current_;
            }

            std::string_view text_;
            const char *current_;
            const char *end_;
        };

    } // namespace

    bool JsonValue::asBool(std::string_view ctx) const
    {
        if (!isBool())
        {
            throw JsonError(std::string(ctx) + ": expected bool");
        }
        return std::get<bool>(value);
    }

    int64_t JsonValue::asInt(std::string_view ctx) const
    {
        if (isInt())
        {
            return std::get<int64_t>(value);
        }
        if (isDouble())
        {
            double v = std::get<double>(value);
            if (std::trunc(v) != v)
            {
                throw JsonError(std::string(ctx) + ": expected integer number");
            }
            return static_cast<int64_t>(v);
        }
        throw JsonError(std::string(ctx) + ": expected integer");
    }

    double JsonValue::asDouble(std::string_view ctx) const
    {
        if (isDouble())
        {
            return std::get<double>(value);
        }
        if (isInt())
        {
            return static_cast<double>(std::get<int64_t>(value));
        }
        throw JsonError(std::string(ctx) + ": expected number");
    }

    const std::string &JsonValue::asString(std::string_view ctx) const
    {
        if (!isString())
        {
            throw JsonError(std::string(ctx) + ": expected string");
        }
        return std::get<std::string>(value);
    }

    const JsonValue::Array &JsonValue::asArray(std::string_view ctx) const
    {
        if (!isArray())
        {
            throw JsonError(std::string(ctx) + ": expected array");
        }
        return std::get<Array>(value);
    }

    const JsonValue::Object &JsonValue::asObject(std::string_view ctx) const
    {
        if (!isObject())
        {
            throw JsonError(std::string(ctx) + ": expected object");
        }
        return std::get<Object>(value);
    }

    const JsonValue *JsonValue::find(std::string_view key) const
    {
        if (!isObject())
        {
            return nullptr;
        }
        const Object &obj = std::get<Object>(value);
        auto it = obj.find(key);
        return it == obj.end() ? nullptr : &it->second;
    }

    JsonValue parse(std::string_view text)
    {
        JsonParser parser(text);
        return parser.parse();
    }

    const JsonValue *resolvePath(const JsonValue &root, std::string_view path)
    {
        const JsonValue *current = &root;
        std::size_t pos = 0;
        while (current && pos < path.size())
        {
            if (path[pos] == '.')
            {
                ++pos;
                continue;
            }
            if (path[pos] == '[')
            {
                const std::size_t close = path.find(']', pos);
                if (close == std::string_view::npos || !current->isArray())
                {
                    return nullptr;
                }
                std::size_t index = 0;
                const std::string_view digits = path.substr(pos + 1, close - pos - 1);
                auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), index);
                if (ec != std::errc() || ptr != digits.data() + digits.size())
                {
                    return nullptr;
                }
                const auto &arr = std::get<JsonValue::Array>(current->value);
                current = index < arr.size() ? &arr[index] : nullptr;
                pos = close + 1;
                continue;
            }
            std::size_t next = path.find_first_of(".[", pos);
            if (next == std::string_view::npos)
            {
                next = path.size();
            }
            current = current->find(path.substr(pos, next - pos));
            pos = next;
        }
        return current;
    }

    namespace
    {

        // Index of the bracket closing the value opened at `start`, skipping string contents;
        // npos when the brackets do not balance.
        std::size_t balancedEnd(std::string_view text, std::size_t start)
        {
            std::vector<char> closers;
            bool inString = false;
            bool escaped = false;
            for (std::size_t i = start; i < text.size(); ++i)
            {
                const char c = text[i];
                if (inString)
                {
                    if (escaped)
                    {
                        escaped = false;
                    }
                    else if (c == '\\')
                    {
                        escaped = true;
                    }
                    else if (c == '"')
                    {
                        inString = false;
                    }
                    continue;
                }
                switch (c)
                {
                case '"':
                    inString = true;
                    break;
                case '{':
                    closers.push_back('}');
                    break;
                case '[':
                    closers.push_back(']');
                    break;
                case '}':
                case ']':
                    if (closers.empty() || closers.back() != c)
                    {
                        return std::string_view::npos;
                    }
                    closers.pop_back();
                    if (closers.empty())
                    {
                        return i;
                    }
                    break;
                default:
                    break;
                }
            }
            return std::string_view::npos;
        }

    } // namespace

    std::optional<std::string_view> locateDocument(std::string_view text)
    {
        const std::size_t fence = text.find("```json");
        if (fence != std::string_view::npos)
        {
            const std::size_t bodyStart = text.find('\n', fence);
            if (bodyStart != std::string_view::npos)
            {
                const std::size_t bodyEnd = text.find("```", bodyStart + 1);
                if (bodyEnd != std::string_view::npos)
                {
                    text = text.substr(bodyStart + 1, bodyEnd - bodyStart - 1);
                }
            }
        }

        std::optional<std::string_view> firstBalanced;
        for (std::size_t pos = text.find_first_of("{["); pos != std::string_view::npos;
             pos = text.find_first_of("{[", pos + 1))
        {
            const std::size_t end = balancedEnd(text, pos);
            if (end == std::string_view::npos)
            {
                continue;
            }
            const std::string_view candidate = text.substr(pos, end - pos + 1);
            if (!firstBalanced)
            {
                firstBalanced = candidate;
            }
            try
            {
                const JsonValue value = parse(candidate);
                if (value.isObject() || (value.isArray() && !value.asArray("document").empty() &&
                                         value.asArray("document").front().isObject()))
                {
                    return candidate;
                }
            }
            catch (const JsonError &)
            {
                // Prose such as "{carry, sum}"; keep scanning.
            }
        }
        return firstBalanced;
    }

} // namespace veriloop::lib::json
