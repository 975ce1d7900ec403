/**
 * @file element_builder.hpp
 * @brief Helpers for assembling JSONB test input by hand.
 */

#ifndef JSONB_TESTS_ELEMENT_BUILDER_HPP
#define JSONB_TESTS_ELEMENT_BUILDER_HPP

#include <jsonb/header.hpp>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace jsonb::test {

using Bytes = std::vector<std::uint8_t>;

inline Bytes bytes(std::string_view text) {
    return Bytes(text.begin(), text.end());
}

/**
 * @brief Header with an explicit size-field width.
 *
 * @param width 0 (inline size), 1, 2, 4 or 8
 */
inline Bytes header(Type type, std::uint64_t size, std::size_t width) {
    Bytes out;
    auto tag = static_cast<std::uint8_t>(type);
    switch (width) {
    case 0:
        out.push_back(static_cast<std::uint8_t>((size << 4) | tag));
        return out;
    case 1:
        out.push_back(static_cast<std::uint8_t>(0xC0 | tag));
        break;
    case 2:
        out.push_back(static_cast<std::uint8_t>(0xD0 | tag));
        break;
    case 4:
        out.push_back(static_cast<std::uint8_t>(0xE0 | tag));
        break;
    default:
        out.push_back(static_cast<std::uint8_t>(0xF0 | tag));
        width = 8;
        break;
    }
    for (std::size_t i = width; i > 0; --i) {
        out.push_back(static_cast<std::uint8_t>(size >> (8 * (i - 1))));
    }
    return out;
}

/**
 * @brief Smallest header able to hold size.
 */
inline Bytes header(Type type, std::uint64_t size) {
    if (size <= 11) {
        return header(type, size, 0);
    }
    if (size <= 0xFF) {
        return header(type, size, 1);
    }
    if (size <= 0xFFFF) {
        return header(type, size, 2);
    }
    if (size <= 0xFFFFFFFFULL) {
        return header(type, size, 4);
    }
    return header(type, size, 8);
}

inline Bytes element(Type type, const Bytes& payload) {
    Bytes out = header(type, payload.size());
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

inline Bytes element(Type type, std::string_view payload) {
    return element(type, bytes(payload));
}

inline Bytes concat(std::initializer_list<Bytes> parts) {
    Bytes out;
    for (const auto& part : parts) {
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

inline Bytes null_element() {
    return {0x00};
}

inline Bytes int_element(std::string_view literal) {
    return element(Type::Int, literal);
}

inline Bytes text_element(std::string_view text) {
    return element(Type::Text, text);
}

inline Bytes array_element(std::initializer_list<Bytes> children) {
    return element(Type::Array, concat(children));
}

inline Bytes object_element(std::initializer_list<Bytes> children) {
    return element(Type::Object, concat(children));
}

/**
 * @brief Arrays nested depth levels deep, innermost empty: [[...[]...]]
 */
inline Bytes nested_arrays(std::size_t depth) {
    Bytes out = {0x0B};
    for (std::size_t i = 1; i < depth; ++i) {
        out = element(Type::Array, out);
    }
    return out;
}

} // namespace jsonb::test

#endif // JSONB_TESTS_ELEMENT_BUILDER_HPP
