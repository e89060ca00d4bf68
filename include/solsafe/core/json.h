// SOLSAFE - JSON Value
// Copyright (c) 2024 SOLSAFE Developers
// MIT License
//
// Minimal JSON document model for store envelopes and evidence bundles.
// Objects keep their keys sorted, so ToJSON() output is canonical: the same
// document always serializes to the same bytes.

#ifndef SOLSAFE_CORE_JSON_H
#define SOLSAFE_CORE_JSON_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace solsafe {

class JSONValue {
public:
    enum class Type {
        Null,
        Bool,
        Int,
        String,
        Array,
        Object
    };

    using Array = std::vector<JSONValue>;
    using Object = std::map<std::string, JSONValue>;

    JSONValue() : type_(Type::Null) {}
    JSONValue(std::nullptr_t) : type_(Type::Null) {}
    JSONValue(bool value) : type_(Type::Bool), boolValue_(value) {}
    JSONValue(int value) : type_(Type::Int), intValue_(value) {}
    JSONValue(int64_t value) : type_(Type::Int), intValue_(value) {}
    JSONValue(uint64_t value) : type_(Type::Int), intValue_(static_cast<int64_t>(value)) {}
    JSONValue(const char* value) : type_(Type::String), stringValue_(value) {}
    JSONValue(const std::string& value) : type_(Type::String), stringValue_(value) {}
    JSONValue(std::string&& value) : type_(Type::String), stringValue_(std::move(value)) {}
    JSONValue(const Array& value) : type_(Type::Array), arrayValue_(value) {}
    JSONValue(Array&& value) : type_(Type::Array), arrayValue_(std::move(value)) {}
    JSONValue(const Object& value) : type_(Type::Object), objectValue_(value) {}
    JSONValue(Object&& value) : type_(Type::Object), objectValue_(std::move(value)) {}

    Type GetType() const { return type_; }
    bool IsNull() const { return type_ == Type::Null; }
    bool IsBool() const { return type_ == Type::Bool; }
    bool IsInt() const { return type_ == Type::Int; }
    bool IsString() const { return type_ == Type::String; }
    bool IsArray() const { return type_ == Type::Array; }
    bool IsObject() const { return type_ == Type::Object; }

    // Lenient getters: return the default on a type mismatch
    bool GetBool(bool defaultValue = false) const;
    int64_t GetInt(int64_t defaultValue = 0) const;
    const std::string& GetString() const;
    const Array& GetArray() const;
    const Object& GetObject() const;

    // Strict getters for required fields: throw std::invalid_argument
    // naming the key when it is missing or has the wrong type
    const std::string& RequireString(const std::string& key) const;
    int64_t RequireInt(const std::string& key) const;
    bool RequireBool(const std::string& key) const;
    const Array& RequireArray(const std::string& key) const;

    // Object access
    bool HasKey(const std::string& key) const;
    const JSONValue& operator[](const std::string& key) const;
    JSONValue& operator[](const std::string& key);

    // Array access
    size_t Size() const;
    const JSONValue& operator[](size_t index) const;
    void Push(JSONValue value);

    bool operator==(const JSONValue& other) const;
    bool operator!=(const JSONValue& other) const { return !(*this == other); }

    /// Serialize; compact output is canonical
    std::string ToJSON(bool pretty = false, int indent = 0) const;

    /// Parse a complete document. Throws std::invalid_argument with the
    /// byte offset of the first error.
    static JSONValue Parse(const std::string& json);

    static std::optional<JSONValue> TryParse(const std::string& json);

    static const JSONValue& Null() { return nullValue_; }

private:
    Type type_;
    bool boolValue_{false};
    int64_t intValue_{0};
    std::string stringValue_;
    Array arrayValue_;
    Object objectValue_;

    const JSONValue& Require(const std::string& key, Type type, const char* typeName) const;

    static const JSONValue nullValue_;
    static const Array emptyArray_;
    static const Object emptyObject_;
    static const std::string emptyString_;
};

} // namespace solsafe

#endif // SOLSAFE_CORE_JSON_H
