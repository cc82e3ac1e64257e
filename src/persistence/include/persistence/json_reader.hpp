#pragma once
#include "core/result.hpp"
#include <string>
#include <vector>

namespace tlc::persistence {

// Parsed JSON document. Object members keep their file order.
struct JsonValue {
    enum class Type { Null, Bool, Number, String, Array, Object };
    Type type = Type::Null;
    bool boolean = false;
    double number = 0.0;
    std::string text;
    std::vector<JsonValue> items;        // Array elements or Object values
    std::vector<std::string> keys;       // Object keys, parallel to items

    bool is_null() const { return type == Type::Null; }
    bool is_object() const { return type == Type::Object; }
    bool is_array() const { return type == Type::Array; }
    bool is_number() const { return type == Type::Number; }
    bool is_string() const { return type == Type::String; }
    bool is_bool() const { return type == Type::Bool; }

    // Member lookup; null when absent or when this is not an object.
    const JsonValue* get(const std::string& key) const;
};

core::Result<JsonValue> parse_json(const std::string& text);

} // namespace tlc::persistence
