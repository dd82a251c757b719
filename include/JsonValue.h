#pragma once

#include <string>
#include <unordered_map>
#include <vector>

/**
 * @brief Minimal JSON document model shared by the artifact loaders and the HTTP layer.
 */
struct JsonValue {
    enum class Type { Null, Bool, Number, String, Array, Object };

    Type type = Type::Null;
    bool booleanValue = false;
    double numberValue = 0.0;
    std::string stringValue;
    std::vector<JsonValue> arrayValue;
    std::unordered_map<std::string, JsonValue> objectValue;

    bool isNull() const noexcept { return type == Type::Null; }
    bool isBool() const noexcept { return type == Type::Bool; }
    bool isObject() const noexcept { return type == Type::Object; }
    bool isArray() const noexcept { return type == Type::Array; }
    bool isString() const noexcept { return type == Type::String; }
    bool isNumber() const noexcept { return type == Type::Number; }

    const JsonValue* find(const std::string& key) const;
    std::string dump() const;
};

/**
 * @throws ChurnServe::JsonException on malformed input or trailing content.
 */
JsonValue parseJsonText(const std::string& text);

/**
 * @throws ChurnServe::IOException when the file cannot be read, ChurnServe::JsonException when it is not JSON.
 */
JsonValue parseJsonFile(const std::string& path);

std::string escapeJsonString(const std::string& value);

// Shortest round-trippable rendering; non-finite values render as null.
std::string formatJsonNumber(double value);
