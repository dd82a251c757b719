#include "JsonValue.h"

#include "ChurnServeExceptions.h"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <utility>

namespace {
constexpr size_t kMaxNestingDepth = 256;

class JsonParser {
public:
    explicit JsonParser(const std::string& source) : text(source) {}

    JsonValue parse() {
        skipWhitespace();
        JsonValue value = parseValue(0);
        skipWhitespace();
        if (position != text.size()) {
            fail("unexpected trailing content");
        }
        return value;
    }

private:
    const std::string& text;
    size_t position = 0;

    [[noreturn]] void fail(const std::string& what) const {
        throw ChurnServe::JsonException(what + " at offset " + std::to_string(position));
    }

    void skipWhitespace() {
        while (position < text.size() && std::isspace(static_cast<unsigned char>(text[position])) != 0) {
            ++position;
        }
    }

    char peek() const {
        if (position >= text.size()) fail("unexpected end of input");
        return text[position];
    }

    char take() {
        if (position >= text.size()) fail("unexpected end of input");
        return text[position++];
    }

    void expect(char expected) {
        if (take() != expected) {
            --position;
            fail(std::string("expected '") + expected + "'");
        }
    }

    JsonValue parseValue(size_t depth) {
        if (depth > kMaxNestingDepth) fail("nesting too deep");
        skipWhitespace();
        const char c = peek();
        if (c == '{') return parseObject(depth);
        if (c == '[') return parseArray(depth);
        if (c == '"') return parseString();
        if (c == 't' || c == 'f') return parseBoolean();
        if (c == 'n') return parseNull();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) return parseNumber();
        fail("invalid token");
    }

    JsonValue parseObject(size_t depth) {
        JsonValue object;
        object.type = JsonValue::Type::Object;

        expect('{');
        skipWhitespace();
        if (peek() == '}') {
            take();
            return object;
        }

        while (true) {
            skipWhitespace();
            JsonValue key = parseString();
            skipWhitespace();
            expect(':');
            JsonValue value = parseValue(depth + 1);
            object.objectValue[key.stringValue] = std::move(value);

            skipWhitespace();
            const char next = take();
            if (next == '}') break;
            if (next != ',') fail("expected ',' or '}' in object");
        }
        return object;
    }

    JsonValue parseArray(size_t depth) {
        JsonValue array;
        array.type = JsonValue::Type::Array;

        expect('[');
        skipWhitespace();
        if (peek() == ']') {
            take();
            return array;
        }

        while (true) {
            array.arrayValue.push_back(parseValue(depth + 1));
            skipWhitespace();
            const char next = take();
            if (next == ']') break;
            if (next != ',') fail("expected ',' or ']' in array");
        }
        return array;
    }

    uint32_t parseHex4() {
        uint32_t code = 0;
        for (int i = 0; i < 4; ++i) {
            const char h = take();
            code <<= 4;
            if (h >= '0' && h <= '9') code |= static_cast<uint32_t>(h - '0');
            else if (h >= 'a' && h <= 'f') code |= static_cast<uint32_t>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') code |= static_cast<uint32_t>(h - 'A' + 10);
            else fail("invalid \\u escape");
        }
        return code;
    }

    static void appendUtf8(std::string& out, uint32_t code) {
        if (code < 0x80) {
            out.push_back(static_cast<char>(code));
        } else if (code < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (code >> 6)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else if (code < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (code >> 12)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (code >> 18)));
            out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
    }

    JsonValue parseString() {
        JsonValue str;
        str.type = JsonValue::Type::String;

        expect('"');
        while (true) {
            const char c = take();
            if (c == '"') break;
            if (c != '\\') {
                str.stringValue.push_back(c);
                continue;
            }
            const char escaped = take();
            switch (escaped) {
                case '"': str.stringValue.push_back('"'); break;
                case '\\': str.stringValue.push_back('\\'); break;
                case '/': str.stringValue.push_back('/'); break;
                case 'b': str.stringValue.push_back('\b'); break;
                case 'f': str.stringValue.push_back('\f'); break;
                case 'n': str.stringValue.push_back('\n'); break;
                case 'r': str.stringValue.push_back('\r'); break;
                case 't': str.stringValue.push_back('\t'); break;
                case 'u': {
                    uint32_t code = parseHex4();
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        expect('\\');
                        expect('u');
                        const uint32_t low = parseHex4();
                        if (low < 0xDC00 || low > 0xDFFF) fail("invalid surrogate pair");
                        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                    }
                    appendUtf8(str.stringValue, code);
                    break;
                }
                default:
                    fail("unsupported escape sequence");
            }
        }
        return str;
    }

    JsonValue parseBoolean() {
        JsonValue value;
        value.type = JsonValue::Type::Bool;
        if (text.compare(position, 4, "true") == 0) {
            value.booleanValue = true;
            position += 4;
            return value;
        }
        if (text.compare(position, 5, "false") == 0) {
            position += 5;
            return value;
        }
        fail("invalid boolean");
    }

    JsonValue parseNull() {
        if (text.compare(position, 4, "null") != 0) fail("invalid null");
        position += 4;
        return JsonValue{};
    }

    JsonValue parseNumber() {
        const size_t start = position;
        auto skipDigits = [this]() {
            while (position < text.size() && std::isdigit(static_cast<unsigned char>(text[position])) != 0) {
                ++position;
            }
        };

        if (peek() == '-') take();
        skipDigits();
        if (position < text.size() && text[position] == '.') {
            ++position;
            skipDigits();
        }
        if (position < text.size() && (text[position] == 'e' || text[position] == 'E')) {
            ++position;
            if (position < text.size() && (text[position] == '+' || text[position] == '-')) ++position;
            skipDigits();
        }

        const std::string token = text.substr(start, position - start);
        JsonValue number;
        number.type = JsonValue::Type::Number;
        try {
            size_t consumed = 0;
            number.numberValue = std::stod(token, &consumed);
            if (consumed != token.size()) fail("invalid number '" + token + "'");
        } catch (const std::invalid_argument&) {
            fail("invalid number '" + token + "'");
        } catch (const std::out_of_range&) {
            fail("number out of range '" + token + "'");
        }
        return number;
    }
};
} // namespace

const JsonValue* JsonValue::find(const std::string& key) const {
    if (!isObject()) return nullptr;
    auto it = objectValue.find(key);
    if (it == objectValue.end()) return nullptr;
    return &it->second;
}

std::string JsonValue::dump() const {
    switch (type) {
        case Type::Null:
            return "null";
        case Type::Bool:
            return booleanValue ? "true" : "false";
        case Type::Number:
            return formatJsonNumber(numberValue);
        case Type::String:
            return "\"" + escapeJsonString(stringValue) + "\"";
        case Type::Array: {
            std::ostringstream out;
            out << '[';
            for (size_t i = 0; i < arrayValue.size(); ++i) {
                if (i > 0) out << ',';
                out << arrayValue[i].dump();
            }
            out << ']';
            return out.str();
        }
        case Type::Object: {
            std::ostringstream out;
            out << '{';
            bool first = true;
            for (const auto& kv : objectValue) {
                if (!first) out << ',';
                first = false;
                out << '"' << escapeJsonString(kv.first) << "\":" << kv.second.dump();
            }
            out << '}';
            return out.str();
        }
    }
    return "null";
}

JsonValue parseJsonText(const std::string& text) {
    JsonParser parser(text);
    return parser.parse();
}

JsonValue parseJsonFile(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw ChurnServe::IOException("Failed to open JSON file: " + path);
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    try {
        return parseJsonText(buffer.str());
    } catch (const ChurnServe::JsonException& e) {
        throw ChurnServe::JsonException(path + ": " + e.what());
    }
}

std::string escapeJsonString(const std::string& value) {
    std::ostringstream out;
    for (char c : value) {
        switch (c) {
            case '"': out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\b': out << "\\b"; break;
            case '\f': out << "\\f"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
                } else {
                    out << c;
                }
                break;
        }
    }
    return out.str();
}

std::string formatJsonNumber(double value) {
    if (!std::isfinite(value)) {
        return "null";
    }
    char buffer[64];
    const auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (ec != std::errc{}) {
        std::ostringstream out;
        out << std::setprecision(17) << value;
        return out.str();
    }
    return std::string(buffer, end);
}
