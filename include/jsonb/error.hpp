/**
 * @file error.hpp
 * @brief JSONB error handling.
 *
 * Provides both error-code-based and exception-based error handling.
 * Exceptions can be compiled out with JSONB_NO_EXCEPTIONS=1.
 *
 * @authors jsonb contributors
 */

#ifndef JSONB_ERROR_HPP
#define JSONB_ERROR_HPP

#include "config.hpp"

#if !JSONB_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace jsonb {

/**
 * @brief Error codes returned by all decoding functions.
 */
enum class Error {
    Ok = 0,                   ///< Success
    EmptyInput = -1,          ///< Top-level buffer is empty
    InvalidType = -2,         ///< Reserved type tag (0xD-0xF)
    UnsupportedEncoding = -3, ///< TextJ or Text5 payload
    TruncatedHeader = -4,     ///< Buffer ends inside the size prefix
    TruncatedPayload = -5,    ///< Buffer ends inside the payload
    MalformedScalar = -6,     ///< Null/bool with non-zero payload
    NumericParseError = -7,   ///< Invalid or out-of-range number literal
    TextDecodeError = -8,     ///< Text payload is not valid UTF-8
    NonTextKey = -9,          ///< Object key is not a string
    DuplicateKey = -10,       ///< Object key appears twice
    TruncatedObject = -11,    ///< Object key without a value
    MalformedComposite = -12, ///< Child runs past its parent's payload
    DepthExceeded = -13,      ///< Nesting deeper than the depth limit
    TrailingData = -14,       ///< Bytes after the value (strict mode)
    InvalidArg = -15          ///< Invalid argument
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::EmptyInput:
        return "Input buffer is empty";
    case Error::InvalidType:
        return "Invalid (reserved) element type";
    case Error::UnsupportedEncoding:
        return "Unsupported text encoding (TextJ/Text5)";
    case Error::TruncatedHeader:
        return "Truncated element header";
    case Error::TruncatedPayload:
        return "Truncated element payload";
    case Error::MalformedScalar:
        return "Null or boolean element with non-zero size";
    case Error::NumericParseError:
        return "Invalid numeric literal";
    case Error::TextDecodeError:
        return "Text is not valid UTF-8";
    case Error::NonTextKey:
        return "Object key is not a string";
    case Error::DuplicateKey:
        return "Duplicate object key";
    case Error::TruncatedObject:
        return "Object key has no value";
    case Error::MalformedComposite:
        return "Element extends past the end of its container";
    case Error::DepthExceeded:
        return "Maximum nesting depth exceeded";
    case Error::TrailingData:
        return "Trailing data after value";
    case Error::InvalidArg:
        return "Invalid argument";
    default:
        return "Unknown error";
    }
}

#if !JSONB_NO_EXCEPTIONS

/**
 * @brief Base exception for JSONB errors.
 */
class JsonbException : public std::runtime_error {
public:
    explicit JsonbException(const std::string& message, Error code = Error::InvalidArg)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for invalid arguments.
 */
class InvalidArgumentException : public JsonbException {
public:
    explicit InvalidArgumentException(const std::string& message)
        : JsonbException(message, Error::InvalidArg) {}
};

/**
 * @brief Exception for malformed JSONB input.
 *
 * Carries the offset of the element that failed to decode.
 */
class DecodeException : public JsonbException {
public:
    DecodeException(const std::string& message, Error code, std::size_t offset)
        : JsonbException(message, code), offset_(offset) {}

    std::size_t offset() const noexcept {
        return offset_;
    }

private:
    std::size_t offset_;
};

/**
 * @brief Exception for recognized but unsupported element types.
 */
class UnsupportedException : public DecodeException {
public:
    UnsupportedException(const std::string& message, std::size_t offset)
        : DecodeException(message, Error::UnsupportedEncoding, offset) {}
};

#endif // !JSONB_NO_EXCEPTIONS

} // namespace jsonb

#endif // JSONB_ERROR_HPP
