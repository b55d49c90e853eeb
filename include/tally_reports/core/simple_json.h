#pragma once

#include <cctype>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace tally_reports::simple_json {

struct Value {
    enum class Type {
        kNull,
        kBool,
        kNumber,
        kString,
        kObject,
        kArray,
    };

    Type type{Type::kNull};
    bool bool_value{false};
    // Numbers are kept as source text so decimal amounts can be parsed exactly.
    std::string number_text;
    std::string string_value;
    std::map<std::string, Value> object_value;
    std::vector<Value> array_value;

    bool IsNull() const { return type == Type::kNull; }
    bool IsBool() const { return type == Type::kBool; }
    bool IsNumber() const { return type == Type::kNumber; }
    bool IsString() const { return type == Type::kString; }
    bool IsObject() const { return type == Type::kObject; }
    bool IsArray() const { return type == Type::kArray; }

    const Value* Find(const std::string& key) const {
        if (!IsObject()) {
            return nullptr;
        }
        const auto it = object_value.find(key);
        return it == object_value.end() ? nullptr : &it->second;
    }

    std::string ToString() const {
        if (IsString()) {
            return string_value;
        }
        if (IsBool()) {
            return bool_value ? "true" : "false";
        }
        if (IsNumber()) {
            return number_text;
        }
        if (IsNull()) {
            return "null";
        }
        return "";
    }
};

namespace detail {

class Parser {
   public:
    explicit Parser(const std::string& text) : text_(text) {}

    bool Parse(Value* out, std::string* error) {
        if (out == nullptr) {
            if (error != nullptr) {
                *error = "json output is null";
            }
            return false;
        }
        SkipSpace();
        Value value;
        if (!ParseValue(&value, error)) {
            return false;
        }
        SkipSpace();
        if (!IsEnd()) {
            if (error != nullptr) {
                *error = "unexpected trailing characters in json";
            }
            return false;
        }
        *out = std::move(value);
        return true;
    }

   private:
    bool IsEnd() const { return pos_ >= text_.size(); }

    char Peek() const { return IsEnd() ? '\0' : text_[pos_]; }

    char Take() { return IsEnd() ? '\0' : text_[pos_++]; }

    void SkipSpace() {
        while (!IsEnd() && std::isspace(static_cast<unsigned char>(text_[pos_])) != 0) {
            ++pos_;
        }
    }

    bool ParseValue(Value* out, std::string* error) {
        SkipSpace();
        if (IsEnd()) {
            if (error != nullptr) {
                *error = "unexpected end of json";
            }
            return false;
        }
        const char ch = Peek();
        if (ch == '{') {
            return ParseObject(out, error);
        }
        if (ch == '[') {
            return ParseArray(out, error);
        }
        if (ch == '"') {
            out->type = Value::Type::kString;
            return ParseString(&out->string_value, error);
        }
        if (ch == 't' || ch == 'f') {
            return ParseBool(out, error);
        }
        if (ch == 'n') {
            return ParseNull(out, error);
        }
        return ParseNumber(out, error);
    }

    bool ParseObject(Value* out, std::string* error) {
        if (Take() != '{') {
            if (error != nullptr) {
                *error = "expected '{'";
            }
            return false;
        }
        out->type = Value::Type::kObject;
        out->object_value.clear();

        SkipSpace();
        if (Peek() == '}') {
            Take();
            return true;
        }

        while (true) {
            SkipSpace();
            std::string key;
            if (!ParseString(&key, error)) {
                return false;
            }
            SkipSpace();
            if (Take() != ':') {
                if (error != nullptr) {
                    *error = "expected ':' in object";
                }
                return false;
            }
            Value value;
            if (!ParseValue(&value, error)) {
                return false;
            }
            out->object_value[key] = std::move(value);

            SkipSpace();
            const char next = Take();
            if (next == '}') {
                return true;
            }
            if (next != ',') {
                if (error != nullptr) {
                    *error = "expected ',' or '}' in object";
                }
                return false;
            }
        }
    }

    bool ParseArray(Value* out, std::string* error) {
        if (Take() != '[') {
            if (error != nullptr) {
                *error = "expected '['";
            }
            return false;
        }
        out->type = Value::Type::kArray;
        out->array_value.clear();

        SkipSpace();
        if (Peek() == ']') {
            Take();
            return true;
        }

        while (true) {
            Value item;
            if (!ParseValue(&item, error)) {
                return false;
            }
            out->array_value.push_back(std::move(item));

            SkipSpace();
            const char next = Take();
            if (next == ']') {
                return true;
            }
            if (next != ',') {
                if (error != nullptr) {
                    *error = "expected ',' or ']' in array";
                }
                return false;
            }
        }
    }

    bool ParseString(std::string* out, std::string* error) {
        if (out == nullptr) {
            if (error != nullptr) {
                *error = "string output is null";
            }
            return false;
        }
        if (Take() != '"') {
            if (error != nullptr) {
                *error = "expected '\"'";
            }
            return false;
        }
        std::string result;
        while (!IsEnd()) {
            const char ch = Take();
            if (ch == '"') {
                *out = std::move(result);
                return true;
            }
            if (ch != '\\') {
                result.push_back(ch);
                continue;
            }
            if (IsEnd()) {
                break;
            }
            const char escaped = Take();
            switch (escaped) {
                case '"':
                    result.push_back('"');
                    break;
                case '\\':
                    result.push_back('\\');
                    break;
                case '/':
                    result.push_back('/');
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
                    if (!ParseUnicodeEscape(&result, error)) {
                        return false;
                    }
                    break;
                default:
                    if (error != nullptr) {
                        *error = "unsupported escape sequence";
                    }
                    return false;
            }
        }
        if (error != nullptr) {
            *error = "unterminated string";
        }
        return false;
    }

    bool ReadHex4(unsigned* out) {
        if (pos_ + 4 > text_.size()) {
            return false;
        }
        unsigned value = 0;
        for (int i = 0; i < 4; ++i) {
            const char ch = text_[pos_++];
            value <<= 4;
            if (ch >= '0' && ch <= '9') {
                value |= static_cast<unsigned>(ch - '0');
            } else if (ch >= 'a' && ch <= 'f') {
                value |= static_cast<unsigned>(ch - 'a' + 10);
            } else if (ch >= 'A' && ch <= 'F') {
                value |= static_cast<unsigned>(ch - 'A' + 10);
            } else {
                return false;
            }
        }
        *out = value;
        return true;
    }

    // Party names exported from Tally are frequently non-ASCII; decode unicode escapes to UTF-8.
    bool ParseUnicodeEscape(std::string* result, std::string* error) {
        unsigned code = 0;
        if (!ReadHex4(&code)) {
            if (error != nullptr) {
                *error = "invalid unicode escape";
            }
            return false;
        }
        if (code >= 0xD800 && code <= 0xDBFF) {
            unsigned low = 0;
            if (Take() != '\\' || Take() != 'u' || !ReadHex4(&low) || low < 0xDC00 ||
                low > 0xDFFF) {
                if (error != nullptr) {
                    *error = "invalid unicode surrogate pair";
                }
                return false;
            }
            code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
        }
        if (code < 0x80) {
            result->push_back(static_cast<char>(code));
        } else if (code < 0x800) {
            result->push_back(static_cast<char>(0xC0 | (code >> 6)));
            result->push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else if (code < 0x10000) {
            result->push_back(static_cast<char>(0xE0 | (code >> 12)));
            result->push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            result->push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else {
            result->push_back(static_cast<char>(0xF0 | (code >> 18)));
            result->push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
            result->push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            result->push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
        return true;
    }

    bool ParseBool(Value* out, std::string* error) {
        if (text_.compare(pos_, 4, "true") == 0) {
            pos_ += 4;
            out->type = Value::Type::kBool;
            out->bool_value = true;
            return true;
        }
        if (text_.compare(pos_, 5, "false") == 0) {
            pos_ += 5;
            out->type = Value::Type::kBool;
            out->bool_value = false;
            return true;
        }
        if (error != nullptr) {
            *error = "invalid bool token";
        }
        return false;
    }

    bool ParseNull(Value* out, std::string* error) {
        if (text_.compare(pos_, 4, "null") != 0) {
            if (error != nullptr) {
                *error = "invalid null token";
            }
            return false;
        }
        pos_ += 4;
        out->type = Value::Type::kNull;
        return true;
    }

    bool ParseNumber(Value* out, std::string* error) {
        const std::size_t begin = pos_;
        if (Peek() == '-') {
            ++pos_;
        }
        bool has_digit = false;
        while (!IsEnd() && std::isdigit(static_cast<unsigned char>(Peek())) != 0) {
            has_digit = true;
            ++pos_;
        }
        if (!IsEnd() && Peek() == '.') {
            ++pos_;
            while (!IsEnd() && std::isdigit(static_cast<unsigned char>(Peek())) != 0) {
                has_digit = true;
                ++pos_;
            }
        }
        if (!IsEnd() && (Peek() == 'e' || Peek() == 'E')) {
            ++pos_;
            if (!IsEnd() && (Peek() == '+' || Peek() == '-')) {
                ++pos_;
            }
            bool exp_digit = false;
            while (!IsEnd() && std::isdigit(static_cast<unsigned char>(Peek())) != 0) {
                exp_digit = true;
                ++pos_;
            }
            if (!exp_digit) {
                if (error != nullptr) {
                    *error = "invalid number exponent";
                }
                return false;
            }
        }
        if (!has_digit) {
            if (error != nullptr) {
                *error = "invalid number token";
            }
            return false;
        }

        out->type = Value::Type::kNumber;
        out->number_text = text_.substr(begin, pos_ - begin);
        return true;
    }

    const std::string& text_;
    std::size_t pos_{0};
};

}  // namespace detail

inline bool Parse(const std::string& text, Value* out, std::string* error) {
    detail::Parser parser(text);
    return parser.Parse(out, error);
}

}  // namespace tally_reports::simple_json
