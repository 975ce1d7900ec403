/**
 * @file header.hpp
 * @brief JSONB element types and header parsing.
 *
 * Every JSONB element starts with a 1-9 byte header:
 * - low nibble of byte 0: element type
 * - high nibble of byte 0: size selector
 *   - 0-11: payload size is the selector itself
 *   - 12/13/14/15: payload size follows as a 1/2/4/8 byte big-endian integer
 *
 * @authors jsonb contributors
 *
 * @see https://sqlite.org/jsonb.html SQLite JSONB format
 */

#ifndef JSONB_HEADER_HPP
#define JSONB_HEADER_HPP

#include "bytereader.hpp"
#include "config.hpp"
#include "error.hpp"

namespace jsonb {

/**
 * @brief Element type tag (low nibble of the first header byte).
 */
enum class Type : std::uint8_t {
    Null = 0x0,
    True = 0x1,
    False = 0x2,
    Int = 0x3,
    Int5 = 0x4,   ///< JSON5 integer, may be hexadecimal
    Float = 0x5,
    Float5 = 0x6, ///< JSON5 float (".5", "5.", ...)
    Text = 0x7,
    TextJ = 0x8,  ///< Text with JSON escapes (unsupported)
    Text5 = 0x9,  ///< Text with JSON5 escapes (unsupported)
    TextRaw = 0xA,
    Array = 0xB,
    Object = 0xC,
    Reserved13 = 0xD,
    Reserved14 = 0xE,
    Reserved15 = 0xF
};

/**
 * @brief Get the name of an element type.
 */
inline const char* type_name(Type type) noexcept {
    switch (type) {
    case Type::Null:
        return "NULL";
    case Type::True:
        return "TRUE";
    case Type::False:
        return "FALSE";
    case Type::Int:
        return "INT";
    case Type::Int5:
        return "INT5";
    case Type::Float:
        return "FLOAT";
    case Type::Float5:
        return "FLOAT5";
    case Type::Text:
        return "TEXT";
    case Type::TextJ:
        return "TEXTJ";
    case Type::Text5:
        return "TEXT5";
    case Type::TextRaw:
        return "TEXTRAW";
    case Type::Array:
        return "ARRAY";
    case Type::Object:
        return "OBJECT";
    default:
        return "RESERVED";
    }
}

inline constexpr bool is_reserved(Type type) noexcept {
    return type >= Type::Reserved13;
}

inline constexpr bool is_composite(Type type) noexcept {
    return type == Type::Array || type == Type::Object;
}

/**
 * @brief Parsed element header.
 *
 * Transient: produced for each element and discarded once its payload
 * has been interpreted.
 */
struct Header {
    Type type = Type::Null;
    std::uint64_t payload_size = 0; ///< Declared payload size in bytes
    std::size_t header_size = 0;    ///< Bytes used by the header itself (1, 2, 3, 5 or 9)
};

/**
 * @brief Parse an element header.
 *
 * The type is validated before any size byte is read, so reserved and
 * unsupported types are reported even when the size prefix is truncated.
 * On success the reader is positioned at the first payload byte. The
 * payload itself is not checked against the reader's remaining bytes.
 *
 * @param reader Byte reader positioned at the element
 * @param[out] header Parsed header
 * @return Error::Ok, Error::InvalidType, Error::UnsupportedEncoding or
 *         Error::TruncatedHeader
 */
inline Error read_header(ByteReader& reader, Header& header) noexcept {
    int first = reader.read_byte();
    if (first < 0) {
        return Error::TruncatedHeader;
    }

    auto type = static_cast<Type>(first & 0x0F);
    if (is_reserved(type)) {
        return Error::InvalidType;
    }
    if (type == Type::TextJ || type == Type::Text5) {
        return Error::UnsupportedEncoding;
    }

    auto selector = static_cast<std::uint8_t>((first & 0xF0) >> 4);
    if (selector <= MAX_INLINE_SIZE) {
        header.type = type;
        header.payload_size = selector;
        header.header_size = 1;
        return Error::Ok;
    }

    // 12 -> 1 byte, 13 -> 2 bytes, 14 -> 4 bytes, 15 -> 8 bytes
    std::size_t width = std::size_t{1} << (selector - 12U);
    std::uint64_t size = 0;
    if (!reader.read_be(width, size)) {
        return Error::TruncatedHeader;
    }

    header.type = type;
    header.payload_size = size;
    header.header_size = 1 + width;
    return Error::Ok;
}

} // namespace jsonb

#endif // JSONB_HEADER_HPP
