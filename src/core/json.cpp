// SOLSAFE - JSON Value Implementation
// Copyright (c) 2024 SOLSAFE Developers
// MIT License

#include "solsafe/core/json.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace solsafe {

// ============================================================================
// Static Members
// ============================================================================

const JSONValue JSONValue::nullValue_;
const JSONValue::Array JSONValue::emptyArray_;
const JSONValue::Object JSONValue::emptyObject_;
const std::string JSONValue::emptyString_;

namespace {

/// Maximum nesting accepted by the parser
constexpr int MAX_DEPTH = 64;

void WriteEscaped(std::ostringstream& ss, const std::string& str) {
    static const char* HEX = "0123456789abcdef";
    ss << '"';
    for (char c : str) {
        switch (c) {
            case '"': ss << "\\\""; break;
            case '\\': ss << "\\\\"; break;
            case '\b': ss << "\\b"; break;
            case '\f': ss << "\\f"; break;
            case '\n': ss << "\\n"; break;
            case '\r': ss << "\\r"; break;
            case '\t': ss << "\\t"; break;
            default: {
                auto u = static_cast<unsigned char>(c);
                if (u < 0x20) {
                    ss << "\\u00" << HEX[u >> 4] << HEX[u & 0x0F];
                } else {
                    ss << c;
                }
            }
        }
    }
    ss << '"';
}

void AppendUtf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

/// Recursive-descent parser over a single document
class Parser {
public:
    explicit Parser(const std::string& text) : text_(text) {}

    JSONValue ParseDocument() {
        JSONValue value = ParseValue(0);
        SkipWhitespace();
        if (pos_ != text_.size()) {
            Fail("trailing characters");
        }
        return value;
    }

private:
    const std::string& text_;
    size_t pos_{0};

    [[noreturn]] void Fail(const std::string& what) const {
        throw std::invalid_argument("JSON parse error at offset " +
                                    std::to_string(pos_) + ": " + what);
    }

    void SkipWhitespace() {
        while (pos_ < text_.size() &&
               std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    bool Consume(const char* literal) {
        size_t len = std::char_traits<char>::length(literal);
        if (text_.compare(pos_, len, literal) == 0) {
            pos_ += len;
            return true;
        }
        return false;
    }

    void Expect(char c) {
        if (pos_ >= text_.size() || text_[pos_] != c) {
            Fail(std::string("expected '") + c + "'");
        }
        ++pos_;
    }

    JSONValue ParseValue(int depth) {
        if (depth > MAX_DEPTH) {
            Fail("nesting too deep");
        }
        SkipWhitespace();
        if (pos_ >= text_.size()) {
            Fail("unexpected end of input");
        }

        char c = text_[pos_];
        if (c == '{') return ParseObject(depth);
        if (c == '[') return ParseArray(depth);
        if (c == '"') return JSONValue(ParseString());
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return ParseInt();
        if (Consume("null")) return JSONValue();
        if (Consume("true")) return JSONValue(true);
        if (Consume("false")) return JSONValue(false);

        Fail("unexpected character");
    }

    JSONValue ParseObject(int depth) {
        Expect('{');
        JSONValue::Object obj;
        SkipWhitespace();
        if (pos_ < text_.size() && text_[pos_] == '}') {
            ++pos_;
            return JSONValue(std::move(obj));
        }
        for (;;) {
            SkipWhitespace();
            std::string key = ParseString();
            if (obj.count(key)) {
                Fail("duplicate key '" + key + "'");
            }
            SkipWhitespace();
            Expect(':');
            obj.emplace(std::move(key), ParseValue(depth + 1));
            SkipWhitespace();
            if (pos_ < text_.size() && text_[pos_] == '}') {
                ++pos_;
                return JSONValue(std::move(obj));
            }
            Expect(',');
        }
    }

    JSONValue ParseArray(int depth) {
        Expect('[');
        JSONValue::Array arr;
        SkipWhitespace();
        if (pos_ < text_.size() && text_[pos_] == ']') {
            ++pos_;
            return JSONValue(std::move(arr));
        }
        for (;;) {
            arr.push_back(ParseValue(depth + 1));
            SkipWhitespace();
            if (pos_ < text_.size() && text_[pos_] == ']') {
                ++pos_;
                return JSONValue(std::move(arr));
            }
            Expect(',');
        }
    }

    std::string ParseString() {
        Expect('"');
        std::string out;
        while (pos_ < text_.size() && text_[pos_] != '"') {
            char c = text_[pos_++];
            if (static_cast<unsigned char>(c) < 0x20) {
                Fail("control character in string");
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            if (pos_ >= text_.size()) break;
            char esc = text_[pos_++];
            switch (esc) {
                case '"': out += '"'; break;
                case '\\': out += '\\'; break;
                case '/': out += '/'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                case 'u': AppendUtf8(out, ParseCodeUnit()); break;
                default: Fail("invalid escape");
            }
        }
        Expect('"');
        return out;
    }

    uint32_t ParseCodeUnit() {
        if (pos_ + 4 > text_.size()) {
            Fail("truncated \\u escape");
        }
        uint32_t cp = 0;
        for (int i = 0; i < 4; ++i) {
            char h = text_[pos_++];
            cp <<= 4;
            if (h >= '0' && h <= '9') cp |= static_cast<uint32_t>(h - '0');
            else if (h >= 'a' && h <= 'f') cp |= static_cast<uint32_t>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') cp |= static_cast<uint32_t>(h - 'A' + 10);
            else Fail("invalid \\u escape");
        }
        if (cp >= 0xD800 && cp <= 0xDFFF) {
            // Documents written by ToJSON never contain surrogate escapes
            Fail("surrogate \\u escape not supported");
        }
        return cp;
    }

    JSONValue ParseInt() {
        size_t start = pos_;
        if (text_[pos_] == '-') ++pos_;
        size_t digits = pos_;
        while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
        if (pos_ == digits) {
            Fail("expected digits");
        }
        if (pos_ < text_.size() &&
            (text_[pos_] == '.' || text_[pos_] == 'e' || text_[pos_] == 'E')) {
            Fail("fractional numbers are not supported");
        }

        std::string numStr = text_.substr(start, pos_ - start);
        errno = 0;
        char* end = nullptr;
        long long value = std::strtoll(numStr.c_str(), &end, 10);
        if (errno == ERANGE) {
            Fail("integer out of range");
        }
        return JSONValue(static_cast<int64_t>(value));
    }
};

} // namespace

// ============================================================================
// Getters
// ============================================================================

bool JSONValue::GetBool(bool defaultValue) const {
    return type_ == Type::Bool ? boolValue_ : defaultValue;
}

int64_t JSONValue::GetInt(int64_t defaultValue) const {
    return type_ == Type::Int ? intValue_ : defaultValue;
}

const std::string& JSONValue::GetString() const {
    return type_ == Type::String ? stringValue_ : emptyString_;
}

const JSONValue::Array& JSONValue::GetArray() const {
    return type_ == Type::Array ? arrayValue_ : emptyArray_;
}

const JSONValue::Object& JSONValue::GetObject() const {
    return type_ == Type::Object ? objectValue_ : emptyObject_;
}

const JSONValue& JSONValue::Require(const std::string& key, Type type,
                                    const char* typeName) const {
    if (type_ != Type::Object) {
        throw std::invalid_argument("expected a JSON object holding '" + key + "'");
    }
    auto it = objectValue_.find(key);
    if (it == objectValue_.end()) {
        throw std::invalid_argument("missing field '" + key + "'");
    }
    if (it->second.type_ != type) {
        throw std::invalid_argument("field '" + key + "' must be " + typeName);
    }
    return it->second;
}

const std::string& JSONValue::RequireString(const std::string& key) const {
    return Require(key, Type::String, "a string").stringValue_;
}

int64_t JSONValue::RequireInt(const std::string& key) const {
    return Require(key, Type::Int, "an integer").intValue_;
}

bool JSONValue::RequireBool(const std::string& key) const {
    return Require(key, Type::Bool, "a boolean").boolValue_;
}

const JSONValue::Array& JSONValue::RequireArray(const std::string& key) const {
    return Require(key, Type::Array, "an array").arrayValue_;
}

// ============================================================================
// Object / Array Access
// ============================================================================

bool JSONValue::HasKey(const std::string& key) const {
    return type_ == Type::Object && objectValue_.count(key) > 0;
}

const JSONValue& JSONValue::operator[](const std::string& key) const {
    if (type_ != Type::Object) return nullValue_;
    auto it = objectValue_.find(key);
    return it == objectValue_.end() ? nullValue_ : it->second;
}

JSONValue& JSONValue::operator[](const std::string& key) {
    if (type_ != Type::Object) {
        type_ = Type::Object;
        objectValue_.clear();
    }
    return objectValue_[key];
}

size_t JSONValue::Size() const {
    if (type_ == Type::Array) return arrayValue_.size();
    if (type_ == Type::Object) return objectValue_.size();
    return 0;
}

const JSONValue& JSONValue::operator[](size_t index) const {
    if (type_ != Type::Array || index >= arrayValue_.size()) return nullValue_;
    return arrayValue_[index];
}

void JSONValue::Push(JSONValue value) {
    if (type_ != Type::Array) {
        type_ = Type::Array;
        arrayValue_.clear();
    }
    arrayValue_.push_back(std::move(value));
}

bool JSONValue::operator==(const JSONValue& other) const {
    if (type_ != other.type_) return false;
    switch (type_) {
        case Type::Null: return true;
        case Type::Bool: return boolValue_ == other.boolValue_;
        case Type::Int: return intValue_ == other.intValue_;
        case Type::String: return stringValue_ == other.stringValue_;
        case Type::Array: return arrayValue_ == other.arrayValue_;
        case Type::Object: return objectValue_ == other.objectValue_;
    }
    return false;
}

// ============================================================================
// Serialization
// ============================================================================

std::string JSONValue::ToJSON(bool pretty, int indent) const {
    std::ostringstream ss;
    const std::string indentStr(indent * 2, ' ');
    const std::string childIndent((indent + 1) * 2, ' ');

    switch (type_) {
        case Type::Null:
            ss << "null";
            break;

        case Type::Bool:
            ss << (boolValue_ ? "true" : "false");
            break;

        case Type::Int:
            ss << intValue_;
            break;

        case Type::String:
            WriteEscaped(ss, stringValue_);
            break;

        case Type::Array: {
            if (arrayValue_.empty()) {
                ss << "[]";
                break;
            }
            ss << (pretty ? "[\n" : "[");
            for (size_t i = 0; i < arrayValue_.size(); ++i) {
                if (pretty) ss << childIndent;
                ss << arrayValue_[i].ToJSON(pretty, indent + 1);
                if (i + 1 < arrayValue_.size()) ss << ",";
                if (pretty) ss << "\n";
            }
            if (pretty) ss << indentStr;
            ss << "]";
            break;
        }

        case Type::Object: {
            if (objectValue_.empty()) {
                ss << "{}";
                break;
            }
            ss << (pretty ? "{\n" : "{");
            size_t i = 0;
            for (const auto& [key, value] : objectValue_) {
                if (pretty) ss << childIndent;
                WriteEscaped(ss, key);
                ss << (pretty ? ": " : ":") << value.ToJSON(pretty, indent + 1);
                if (++i < objectValue_.size()) ss << ",";
                if (pretty) ss << "\n";
            }
            if (pretty) ss << indentStr;
            ss << "}";
            break;
        }
    }

    return ss.str();
}

JSONValue JSONValue::Parse(const std::string& json) {
    return Parser(json).ParseDocument();
}

std::optional<JSONValue> JSONValue::TryParse(const std::string& json) {
    try {
        return Parse(json);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
}

} // namespace solsafe
