#pragma once

#include <string>
#include <vector>
#include <map>
#include <fstream>
#include <stdexcept>
#include <sstream>
#include <cstdint>
#include <iomanip>
#include <iterator>

#include "string_utils.h"

/**
 * Minimal JSON reader/writer for configuration files and recorded API pages.
 * Supports: objects, arrays, strings, numbers, booleans, null.
 *
 * Object keys are kept in a std::map, so serialization is always in sorted
 * key order. Number literals keep their source text so that ids survive a
 * parse/serialize cycle unchanged.
 */
namespace profile_export {
namespace json {

/**
 * JSON value type - represents any JSON data structure.
 */
struct Value {
    enum Type { OBJECT, ARRAY, STRING, NUMBER, BOOLEAN, NULL_VALUE };

    Type type = NULL_VALUE;

    // Storage for different types
    std::map<std::string, Value> object;
    std::vector<Value> array;
    std::string string;
    double number = 0.0;
    std::string number_text;  // Literal as it appeared in the input
    bool boolean = false;

    static Value make_string(std::string s) {
        Value v;
        v.type = STRING;
        v.string = std::move(s);
        return v;
    }

    static Value make_number(double n) {
        Value v;
        v.type = NUMBER;
        v.number = n;
        return v;
    }

    static Value make_bool(bool b) {
        Value v;
        v.type = BOOLEAN;
        v.boolean = b;
        return v;
    }

    static Value make_object() {
        Value v;
        v.type = OBJECT;
        return v;
    }

    static Value make_array() {
        Value v;
        v.type = ARRAY;
        return v;
    }

    bool is_object() const { return type == OBJECT; }
    bool is_array() const { return type == ARRAY; }
    bool is_string() const { return type == STRING; }
    bool is_number() const { return type == NUMBER; }
    bool is_bool() const { return type == BOOLEAN; }
    bool is_null() const { return type == NULL_VALUE; }

    /**
     * Check if this value is an object and has a specific key.
     */
    bool has_key(const std::string& key) const {
        return type == OBJECT && object.find(key) != object.end();
    }

    /**
     * Get a value by key (for objects). Throws if not an object or key missing.
     */
    const Value& operator[](const std::string& key) const {
        if (type != OBJECT) {
            throw std::runtime_error("JSON value is not an object");
        }
        auto it = object.find(key);
        if (it == object.end()) {
            throw std::runtime_error("JSON key not found: " + key);
        }
        return it->second;
    }

    /**
     * Get a value by index (for arrays). Throws if not an array or out of bounds.
     */
    const Value& operator[](size_t index) const {
        if (type != ARRAY) {
            throw std::runtime_error("JSON value is not an array");
        }
        if (index >= array.size()) {
            throw std::runtime_error("JSON array index out of bounds");
        }
        return array[index];
    }

    /**
     * Returns the member for `key`, or nullptr if absent or not an object.
     */
    const Value* find(const std::string& key) const {
        if (type != OBJECT) {
            return nullptr;
        }
        auto it = object.find(key);
        return it == object.end() ? nullptr : &it->second;
    }

    bool operator==(const Value& other) const {
        if (type != other.type) {
            return false;
        }
        switch (type) {
            case OBJECT:     return object == other.object;
            case ARRAY:      return array == other.array;
            case STRING:     return string == other.string;
            case NUMBER:     return number == other.number;
            case BOOLEAN:    return boolean == other.boolean;
            case NULL_VALUE: return true;
        }
        return false;
    }

    bool operator!=(const Value& other) const {
        return !(*this == other);
    }
};

/**
 * JSON tokenizer/parser.
 */
class Parser {
public:
    explicit Parser(const std::string& json_string) : json_(json_string), pos_(0) {}

    /**
     * Parse the JSON string and return the root value.
     */
    Value parse() {
        Value result = parse_value();
        skip_whitespace();
        if (pos_ != json_.size()) {
            throw std::runtime_error("JSON: trailing characters after value");
        }
        return result;
    }

private:
    const std::string& json_;
    size_t pos_;

    void skip_whitespace() {
        while (pos_ < json_.size() &&
               (json_[pos_] == ' ' || json_[pos_] == '\n' ||
                json_[pos_] == '\t' || json_[pos_] == '\r')) {
            ++pos_;
        }
    }

    bool try_consume(char c) {
        skip_whitespace();
        if (pos_ < json_.size() && json_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    uint32_t parse_hex4() {
        if (pos_ + 4 > json_.size()) {
            throw std::runtime_error("JSON: incomplete \\u escape");
        }
        uint32_t code = 0;
        for (int i = 0; i < 4; ++i) {
            char h = json_[pos_++];
            code <<= 4;
            if (h >= '0' && h <= '9') {
                code |= static_cast<uint32_t>(h - '0');
            } else if (h >= 'a' && h <= 'f') {
                code |= static_cast<uint32_t>(h - 'a' + 10);
            } else if (h >= 'A' && h <= 'F') {
                code |= static_cast<uint32_t>(h - 'A' + 10);
            } else {
                throw std::runtime_error("JSON: invalid \\u escape");
            }
        }
        return code;
    }

    static void append_utf8(std::string& out, uint32_t cp) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    std::string parse_string() {
        skip_whitespace();
        if (pos_ >= json_.size() || json_[pos_] != '"') {
            throw std::runtime_error("JSON: expected string");
        }
        ++pos_;

        std::string result;
        while (pos_ < json_.size()) {
            char c = json_[pos_++];

            if (c == '"') {
                return result;
            }

            if (c == '\\') {
                if (pos_ >= json_.size()) {
                    throw std::runtime_error("JSON: incomplete escape sequence");
                }
                char escape = json_[pos_++];
                switch (escape) {
                    case '"':  result.push_back('"'); break;
                    case '\\': result.push_back('\\'); break;
                    case '/':  result.push_back('/'); break;
                    case 'b':  result.push_back('\b'); break;
                    case 'f':  result.push_back('\f'); break;
                    case 'n':  result.push_back('\n'); break;
                    case 'r':  result.push_back('\r'); break;
                    case 't':  result.push_back('\t'); break;
                    case 'u': {
                        uint32_t cp = parse_hex4();
                        // Surrogate pair
                        if (cp >= 0xD800 && cp <= 0xDBFF &&
                            pos_ + 6 <= json_.size() &&
                            json_[pos_] == '\\' && json_[pos_ + 1] == 'u') {
                            pos_ += 2;
                            uint32_t low = parse_hex4();
                            if (low >= 0xDC00 && low <= 0xDFFF) {
                                cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                            } else {
                                append_utf8(result, cp);
                                cp = low;
                            }
                        }
                        append_utf8(result, cp);
                        break;
                    }
                    default:
                        throw std::runtime_error("JSON: invalid escape sequence");
                }
            } else {
                result.push_back(c);
            }
        }

        throw std::runtime_error("JSON: unterminated string");
    }

    Value parse_value() {
        skip_whitespace();
        if (pos_ >= json_.size()) {
            throw std::runtime_error("JSON: unexpected end of input");
        }

        char c = json_[pos_];

        if (c == '{') {
            return parse_object();
        }

        if (c == '[') {
            return parse_array();
        }

        if (c == '"') {
            return Value::make_string(parse_string());
        }

        if (json_.compare(pos_, 4, "true") == 0) {
            pos_ += 4;
            return Value::make_bool(true);
        }

        if (json_.compare(pos_, 5, "false") == 0) {
            pos_ += 5;
            return Value::make_bool(false);
        }

        if (json_.compare(pos_, 4, "null") == 0) {
            pos_ += 4;
            return Value();
        }

        // Number
        size_t start = pos_;
        if (json_[pos_] == '-') {
            ++pos_;
        }
        while (pos_ < json_.size() &&
               ((json_[pos_] >= '0' && json_[pos_] <= '9') ||
                json_[pos_] == '.' || json_[pos_] == 'e' ||
                json_[pos_] == 'E' || json_[pos_] == '+' || json_[pos_] == '-')) {
            ++pos_;
        }

        if (pos_ > start) {
            Value v;
            v.type = Value::NUMBER;
            v.number_text = json_.substr(start, pos_ - start);
            try {
                v.number = std::stod(v.number_text);
            } catch (const std::exception&) {
                throw std::runtime_error("JSON: invalid number: " + v.number_text);
            }
            return v;
        }

        throw std::runtime_error("JSON: unexpected character");
    }

    Value parse_object() {
        Value v = Value::make_object();

        if (!try_consume('{')) {
            throw std::runtime_error("JSON: expected '{'");
        }

        if (try_consume('}')) {
            return v;
        }

        while (true) {
            std::string key = parse_string();

            if (!try_consume(':')) {
                throw std::runtime_error("JSON: expected ':'");
            }

            Value value = parse_value();
            v.object[std::move(key)] = std::move(value);  // Last duplicate wins

            if (try_consume('}')) {
                break;
            }

            if (!try_consume(',')) {
                throw std::runtime_error("JSON: expected ',' or '}'");
            }
        }

        return v;
    }

    Value parse_array() {
        Value v = Value::make_array();

        if (!try_consume('[')) {
            throw std::runtime_error("JSON: expected '['");
        }

        if (try_consume(']')) {
            return v;
        }

        while (true) {
            v.array.push_back(parse_value());

            if (try_consume(']')) {
                break;
            }

            if (!try_consume(',')) {
                throw std::runtime_error("JSON: expected ',' or ']'");
            }
        }

        return v;
    }
};

/**
 * Parse a JSON document held in memory.
 */
inline Value parse(const std::string& text) {
    Parser parser(text);
    return parser.parse();
}

/**
 * Parse a JSON file and return the root value.
 */
inline Value parse_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open JSON file: " + filepath);
    }

    std::string content(
        (std::istreambuf_iterator<char>(file)),
        std::istreambuf_iterator<char>()
    );

    return parse(content);
}

inline void serialize_to(const Value& value, std::string& out) {
    switch (value.type) {
        case Value::OBJECT: {
            out += '{';
            bool first = true;
            for (const auto& [key, member] : value.object) {
                if (!first) {
                    out += ',';
                }
                out += '"';
                out += string_utils::json_escape(key);
                out += "\":";
                serialize_to(member, out);
                first = false;
            }
            out += '}';
            break;
        }
        case Value::ARRAY: {
            out += '[';
            for (size_t i = 0; i < value.array.size(); ++i) {
                if (i > 0) {
                    out += ',';
                }
                serialize_to(value.array[i], out);
            }
            out += ']';
            break;
        }
        case Value::STRING:
            out += '"';
            out += string_utils::json_escape(value.string);
            out += '"';
            break;
        case Value::NUMBER:
            if (!value.number_text.empty()) {
                out += value.number_text;
            } else {
                std::ostringstream ss;
                ss << std::setprecision(17) << value.number;
                out += ss.str();
            }
            break;
        case Value::BOOLEAN:
            out += value.boolean ? "true" : "false";
            break;
        case Value::NULL_VALUE:
            out += "null";
            break;
    }
}

/**
 * Compact serialization (no whitespace, object keys sorted).
 */
inline std::string serialize(const Value& value) {
    std::string out;
    serialize_to(value, out);
    return out;
}

} // namespace json
} // namespace profile_export
