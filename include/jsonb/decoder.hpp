/**
 * @file decoder.hpp
 * @brief JSONB decoder.
 *
 * Decodes a SQLite JSONB element (and, recursively, everything nested in
 * it) into a Value tree:
 * - Header: type tag + payload size (see header.hpp)
 * - Scalars: null/bool/number/text payloads (see scalar.hpp)
 * - Composites: arrays and objects whose payload is a run of child elements
 *
 * Children are decoded inside the window of their parent's payload; a
 * child that does not fit is reported as Error::MalformedComposite.
 *
 * @authors jsonb contributors
 *
 * @see https://sqlite.org/jsonb.html SQLite JSONB format
 */

#ifndef JSONB_DECODER_HPP
#define JSONB_DECODER_HPP

#include "config.hpp"
#include "error.hpp"
#include "header.hpp"
#include "value.hpp"

#include <vector>

namespace jsonb {

/**
 * @brief Per-call decoding options.
 */
struct DecodeOptions {
    /// Maximum array/object nesting; deeper input fails with Error::DepthExceeded
    std::size_t max_depth = MAX_DEPTH;

    /// Reject bytes following the top-level element (Error::TrailingData)
    bool strict = false;
};

/**
 * @brief JSONB decoder.
 *
 * Holds only its options and the offset of the last failure, so a decoder
 * can be reused for any number of buffers. Use one decoder per thread.
 */
class Decoder {
public:
    /**
     * @brief Construct decoder with options.
     *
     * @param options Depth limit and strictness
     */
    explicit Decoder(const DecodeOptions& options = DecodeOptions()) noexcept
        : options_(options) {}

    /**
     * @brief Decode the element at the start of a buffer.
     *
     * Bytes after the element are ignored unless options().strict is set.
     *
     * @param data Buffer holding a JSONB element
     * @param size Buffer size in bytes
     * @param[out] value Decoded value (unchanged on failure)
     * @return Error::Ok on success, Error::EmptyInput for an empty buffer
     */
    Error decode(const std::uint8_t* data, std::size_t size, Value& value);

    /**
     * @brief Decode one element and report its encoded length.
     *
     * @param data Buffer holding a JSONB element
     * @param size Buffer size in bytes
     * @param[out] value Decoded value (unchanged on failure)
     * @param[out] consumed Header + payload size of the element
     * @return Error::Ok on success
     */
    Error decode_one(const std::uint8_t* data, std::size_t size, Value& value,
                     std::size_t& consumed);

    /**
     * @brief Decode a run of concatenated elements filling the whole buffer.
     *
     * @param data Buffer holding one or more JSONB elements
     * @param size Buffer size in bytes
     * @param[out] values Decoded values in buffer order (unchanged on failure)
     * @return Error::Ok on success
     */
    Error decode_sequence(const std::uint8_t* data, std::size_t size, std::vector<Value>& values);

    /**
     * @brief Offset of the element where the last decode failed.
     *
     * Relative to the start of the buffer passed in. Only meaningful after
     * a call that did not return Error::Ok.
     */
    [[nodiscard]] std::size_t error_offset() const noexcept {
        return error_offset_;
    }

    [[nodiscard]] const DecodeOptions& options() const noexcept {
        return options_;
    }

private:
    Error decode_element(const std::uint8_t* data, std::size_t begin, std::size_t end,
                         std::size_t depth, Value& value, std::size_t& consumed);
    Error decode_scalar(Type type, const std::uint8_t* payload, std::size_t size, Value& value);
    Error decode_array(const std::uint8_t* data, std::size_t begin, std::size_t end,
                       std::size_t depth, Value& value);
    Error decode_object(const std::uint8_t* data, std::size_t begin, std::size_t end,
                        std::size_t depth, Value& value);
    Error check_input(const std::uint8_t* data, std::size_t size) noexcept;

    Error fail(Error error, std::size_t offset) noexcept {
        error_offset_ = offset;
        return error;
    }

    DecodeOptions options_;
    std::size_t error_offset_ = 0;
};

/**
 * @brief Decode the JSONB element at the start of a buffer.
 *
 * @param data Buffer holding a JSONB element
 * @param size Buffer size in bytes
 * @param[out] value Decoded value
 * @param options Depth limit and strictness
 * @return Error::Ok on success
 */
Error decode(const std::uint8_t* data, std::size_t size, Value& value,
             const DecodeOptions& options = {});

/**
 * @brief Decode one element and report how many bytes it occupies.
 */
Error decode_one(const std::uint8_t* data, std::size_t size, Value& value, std::size_t& consumed,
                 const DecodeOptions& options = {});

/**
 * @brief Decode a run of concatenated elements filling the whole buffer.
 */
Error decode_sequence(const std::uint8_t* data, std::size_t size, std::vector<Value>& values,
                      const DecodeOptions& options = {});

#if !JSONB_NO_EXCEPTIONS

/**
 * @brief Decode the element at the start of a buffer, throwing on failure.
 *
 * @throws InvalidArgumentException for a null buffer
 * @throws UnsupportedException for TextJ/Text5 elements
 * @throws DecodeException for any other malformed input
 */
Value decode_or_throw(const std::uint8_t* data, std::size_t size,
                      const DecodeOptions& options = {});

#endif // !JSONB_NO_EXCEPTIONS

} // namespace jsonb

#endif // JSONB_DECODER_HPP
