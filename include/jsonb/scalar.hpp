/**
 * @file scalar.hpp
 * @brief Interpretation of scalar JSONB payloads.
 *
 * Numbers are stored as ASCII text in JSONB:
 * - INT:    canonical JSON integer ("42", "-17")
 * - INT5:   JSON5 integer, possibly hexadecimal ("0x1F")
 * - FLOAT:  JSON float ("3.25", "1e400")
 * - FLOAT5: JSON5 float (".5", "5.")
 *
 * Text payloads are UTF-8 used verbatim.
 *
 * @authors jsonb contributors
 *
 * @see https://sqlite.org/jsonb.html SQLite JSONB format
 */

#ifndef JSONB_SCALAR_HPP
#define JSONB_SCALAR_HPP

#include "config.hpp"
#include "error.hpp"

#include <string_view>

namespace jsonb {

/**
 * @brief Parse a decimal integer literal.
 *
 * Accepts an optional '+' or '-' followed by one or more ASCII digits.
 *
 * @param text Literal text
 * @param[out] value Parsed value
 * @return Error::Ok, or Error::NumericParseError if malformed or outside int64
 */
Error parse_integer(std::string_view text, std::int64_t& value) noexcept;

/**
 * @brief Parse a JSON5 integer literal.
 *
 * Text starting with "0x" is hexadecimal, anything else is decimal.
 *
 * @param text Literal text
 * @param[out] value Parsed value
 * @return Error::Ok, or Error::NumericParseError if malformed or outside int64
 */
Error parse_int5(std::string_view text, std::int64_t& value) noexcept;

/**
 * @brief Parse a floating-point literal (JSON or JSON5 form).
 *
 * Overflow saturates to infinity and underflow to zero, so SQLite's
 * "9e999" encoding of Infinity decodes to infinity. The result does not
 * depend on the global locale.
 *
 * @param text Literal text
 * @param[out] value Parsed value
 * @return Error::Ok, or Error::NumericParseError if malformed
 */
Error parse_float(std::string_view text, double& value) noexcept;

/**
 * @brief Check that text is well-formed UTF-8.
 *
 * Rejects overlong forms, surrogates and code points above U+10FFFF.
 */
bool is_valid_utf8(std::string_view text) noexcept;

} // namespace jsonb

#endif // JSONB_SCALAR_HPP
