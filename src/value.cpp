/**
 * @file value.cpp
 * @brief Value accessors and structural equality.
 */

#include <jsonb/value.hpp>

namespace jsonb {

const char* kind_name(Kind kind) noexcept {
    switch (kind) {
    case Kind::Null:
        return "null";
    case Kind::Bool:
        return "bool";
    case Kind::Int:
        return "int";
    case Kind::Float:
        return "float";
    case Kind::Text:
        return "text";
    case Kind::Array:
        return "array";
    case Kind::Object:
        return "object";
    default:
        return "unknown";
    }
}

std::size_t Value::size() const noexcept {
    switch (kind_) {
    case Kind::Array:
        return array_.size();
    case Kind::Object:
        return object_.size();
    default:
        return 0;
    }
}

const Value* Value::find(std::string_view key) const noexcept {
    if (kind_ != Kind::Object) {
        return nullptr;
    }
    for (const auto& member : object_) {
        if (member.key == key) {
            return &member.value;
        }
    }
    return nullptr;
}

const char* Value::kind_name() const noexcept {
    return jsonb::kind_name(kind_);
}

bool operator==(const Value& lhs, const Value& rhs) noexcept {
    if (lhs.kind() != rhs.kind()) {
        return false;
    }

    switch (lhs.kind()) {
    case Kind::Null:
        return true;
    case Kind::Bool:
        return lhs.as_bool() == rhs.as_bool();
    case Kind::Int:
        return lhs.as_int() == rhs.as_int();
    case Kind::Float:
        return lhs.as_float() == rhs.as_float();
    case Kind::Text:
        return lhs.as_text() == rhs.as_text();
    case Kind::Array:
        return lhs.as_array() == rhs.as_array();
    case Kind::Object:
        return lhs.as_object() == rhs.as_object();
    default:
        return false;
    }
}

} // namespace jsonb
