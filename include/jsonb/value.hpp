/**
 * @file value.hpp
 * @brief Decoded JSON value tree.
 *
 * A Value is one of null, bool, integer, float, text, array or object.
 * Values are immutable once built: they are created through the make_*
 * factories and only expose const accessors, apart from an rvalue
 * as_text() that moves the text out. Containers own their children
 * exclusively.
 *
 * @authors jsonb contributors
 */

#ifndef JSONB_VALUE_HPP
#define JSONB_VALUE_HPP

#include "config.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jsonb {

class Value;
struct Member;

using Array = std::vector<Value>;
using Object = std::vector<Member>; ///< Insertion order preserved, keys unique

/**
 * @brief Kind of a decoded value.
 */
enum class Kind : std::uint8_t { Null, Bool, Int, Float, Text, Array, Object };

/**
 * @brief Decoded JSON value.
 */
class Value {
public:
    /// Null value
    Value() = default;

    static Value make_null();
    static Value make_bool(bool value);
    static Value make_int(std::int64_t value);
    static Value make_float(double value);
    static Value make_text(std::string value);
    static Value make_array(Array elements);
    static Value make_object(Object members);

    [[nodiscard]] Kind kind() const noexcept {
        return kind_;
    }

    bool is_null() const noexcept {
        return kind_ == Kind::Null;
    }
    bool is_bool() const noexcept {
        return kind_ == Kind::Bool;
    }
    bool is_int() const noexcept {
        return kind_ == Kind::Int;
    }
    bool is_float() const noexcept {
        return kind_ == Kind::Float;
    }
    bool is_text() const noexcept {
        return kind_ == Kind::Text;
    }
    bool is_array() const noexcept {
        return kind_ == Kind::Array;
    }
    bool is_object() const noexcept {
        return kind_ == Kind::Object;
    }

    // Typed accessors. The result is only meaningful when kind() matches;
    // otherwise the default (false, 0, empty) is returned.

    bool as_bool() const noexcept {
        return bool_;
    }
    std::int64_t as_int() const noexcept {
        return int_;
    }
    double as_float() const noexcept {
        return float_;
    }
    const std::string& as_text() const& noexcept {
        return text_;
    }
    std::string as_text() && noexcept {
        return std::move(text_);
    }
    const Array& as_array() const noexcept {
        return array_;
    }
    const Object& as_object() const noexcept {
        return object_;
    }

    /**
     * @brief Number of elements (array) or members (object), 0 otherwise.
     */
    [[nodiscard]] std::size_t size() const noexcept;

    /**
     * @brief Look up an object member.
     *
     * @param key Member key
     * @return Pointer to the member's value, or nullptr if absent or not an object
     */
    [[nodiscard]] const Value* find(std::string_view key) const noexcept;

    /**
     * @brief Name of this value's kind ("null", "bool", ...).
     */
    [[nodiscard]] const char* kind_name() const noexcept;

private:
    Kind kind_ = Kind::Null;
    bool bool_ = false;
    std::int64_t int_ = 0;
    double float_ = 0.0;
    std::string text_;
    Array array_;
    Object object_;
};

/**
 * @brief Object member (key/value pair).
 */
struct Member {
    std::string key;
    Value value;
};

inline Value Value::make_null() {
    return Value();
}

inline Value Value::make_bool(bool value) {
    Value v;
    v.kind_ = Kind::Bool;
    v.bool_ = value;
    return v;
}

inline Value Value::make_int(std::int64_t value) {
    Value v;
    v.kind_ = Kind::Int;
    v.int_ = value;
    return v;
}

inline Value Value::make_float(double value) {
    Value v;
    v.kind_ = Kind::Float;
    v.float_ = value;
    return v;
}

inline Value Value::make_text(std::string value) {
    Value v;
    v.kind_ = Kind::Text;
    v.text_ = std::move(value);
    return v;
}

inline Value Value::make_array(Array elements) {
    Value v;
    v.kind_ = Kind::Array;
    v.array_ = std::move(elements);
    return v;
}

inline Value Value::make_object(Object members) {
    Value v;
    v.kind_ = Kind::Object;
    v.object_ = std::move(members);
    return v;
}

/**
 * @brief Structural equality.
 *
 * Kinds must match; objects compare member by member in order.
 */
bool operator==(const Value& lhs, const Value& rhs) noexcept;

inline bool operator!=(const Value& lhs, const Value& rhs) noexcept {
    return !(lhs == rhs);
}

inline bool operator==(const Member& lhs, const Member& rhs) noexcept {
    return lhs.key == rhs.key && lhs.value == rhs.value;
}

inline bool operator!=(const Member& lhs, const Member& rhs) noexcept {
    return !(lhs == rhs);
}

/**
 * @brief Name of a value kind.
 */
const char* kind_name(Kind kind) noexcept;

} // namespace jsonb

#endif // JSONB_VALUE_HPP
