/**
 * @file bytereader.hpp
 * @brief Sequential byte reading from a bounded window.
 *
 * The byte reader provides bounds-checked access to a JSONB element,
 * reading multi-byte size fields big-endian.
 *
 * @authors jsonb contributors
 *
 * @see https://sqlite.org/jsonb.html SQLite JSONB format
 */

#ifndef JSONB_BYTEREADER_HPP
#define JSONB_BYTEREADER_HPP

#include "config.hpp"

namespace jsonb {

/**
 * @brief Sequential reader over a byte window.
 *
 * Never reads outside [data, data + size). Used by header parsing and
 * composite iteration to walk sibling elements.
 */
class ByteReader {
public:
    /**
     * @brief Construct a byte reader.
     *
     * @param data Pointer to the first byte of the window
     * @param size Number of valid bytes in the window
     */
    ByteReader(const std::uint8_t* data, std::size_t size) noexcept
        : data_(data), size_(size), pos_(0) {}

    /**
     * @brief Read a single byte.
     *
     * @return Byte value (0-255), or -1 if no bytes remaining
     */
    inline int read_byte() noexcept {
        if (pos_ >= size_) [[unlikely]] {
            return -1;
        }
        return data_[pos_++];
    }

    /**
     * @brief Read a big-endian unsigned integer.
     *
     * The position is left unchanged on failure.
     *
     * @param num_bytes Width of the integer (1-8)
     * @param[out] value Decoded value
     * @return true on success, false if the width is invalid or too few bytes remain
     */
    bool read_be(std::size_t num_bytes, std::uint64_t& value) noexcept {
        if (num_bytes == 0 || num_bytes > 8) [[unlikely]] {
            return false;
        }

        if (num_bytes > remaining()) [[unlikely]] {
            return false; // Underflow protection
        }

        std::uint64_t result = 0;
        for (std::size_t i = 0; i < num_bytes; ++i) {
            result = (result << 8) | data_[pos_ + i];
        }
        pos_ += num_bytes;
        value = result;
        return true;
    }

    /**
     * @brief Get current position.
     *
     * @return Number of bytes already read
     */
    [[nodiscard]] std::size_t position() const noexcept {
        return pos_;
    }

    /**
     * @brief Get remaining bytes.
     *
     * @return Number of bytes remaining to read
     */
    [[nodiscard]] std::size_t remaining() const noexcept {
        return (pos_ < size_) ? (size_ - pos_) : 0;
    }

private:
    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t pos_;
};

} // namespace jsonb

#endif // JSONB_BYTEREADER_HPP
