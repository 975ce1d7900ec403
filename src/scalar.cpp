/**
 * @file scalar.cpp
 * @brief Numeric literal parsing and UTF-8 validation.
 */

#include <jsonb/scalar.hpp>

#include <charconv>
#include <limits>

namespace jsonb {

namespace {

bool is_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

char to_lower(char c) noexcept {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

bool equals_ignore_case(std::string_view text, std::string_view word) noexcept {
    if (text.size() != word.size()) {
        return false;
    }
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (to_lower(text[i]) != word[i]) {
            return false;
        }
    }
    return true;
}

// [digits][.digits][(e|E)[+|-]digits], at least one mantissa digit
bool is_decimal_float(std::string_view text) noexcept {
    std::size_t pos = 0;
    std::size_t mantissa_digits = 0;

    while (pos < text.size() && is_digit(text[pos])) {
        ++pos;
        ++mantissa_digits;
    }
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && is_digit(text[pos])) {
            ++pos;
            ++mantissa_digits;
        }
    }
    if (mantissa_digits == 0) {
        return false;
    }

    if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
        ++pos;
        if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
            ++pos;
        }
        std::size_t exponent_digits = 0;
        while (pos < text.size() && is_digit(text[pos])) {
            ++pos;
            ++exponent_digits;
        }
        if (exponent_digits == 0) {
            return false;
        }
    }

    return pos == text.size();
}

// Decimal exponent of a literal accepted by is_decimal_float: the number of
// digits before the point counted from the first non-zero one, minus leading
// fraction zeros, plus the exponent. Positive means a magnitude of at least 1.
long decimal_scale(std::string_view text) noexcept {
    long scale = 0;
    bool significant = false;
    std::size_t pos = 0;

    while (pos < text.size() && is_digit(text[pos])) {
        if (text[pos] != '0') {
            significant = true;
        }
        if (significant) {
            ++scale;
        }
        ++pos;
    }
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (!significant && pos < text.size() && text[pos] == '0') {
            --scale;
            ++pos;
        }
        while (pos < text.size() && is_digit(text[pos])) {
            ++pos;
        }
    }

    if (pos < text.size()) {
        ++pos; // 'e' or 'E'
        bool negative = false;
        if (text[pos] == '+' || text[pos] == '-') {
            negative = text[pos] == '-';
            ++pos;
        }
        long exponent = 0;
        for (; pos < text.size(); ++pos) {
            if (exponent < 100000) {
                exponent = exponent * 10 + (text[pos] - '0');
            }
        }
        scale += negative ? -exponent : exponent;
    }

    return scale;
}

} // namespace

Error parse_integer(std::string_view text, std::int64_t& value) noexcept {
    if (text.empty()) {
        return Error::NumericParseError;
    }

    // from_chars takes '-' but not '+'
    std::string_view digits = text;
    if (text.front() == '+') {
        text.remove_prefix(1);
        digits = text;
    } else if (text.front() == '-') {
        digits = text.substr(1);
    }
    if (digits.empty()) {
        return Error::NumericParseError;
    }
    for (char c : digits) {
        if (!is_digit(c)) {
            return Error::NumericParseError;
        }
    }

    std::int64_t result = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return Error::NumericParseError;
    }

    value = result;
    return Error::Ok;
}

Error parse_int5(std::string_view text, std::int64_t& value) noexcept {
    if (text.substr(0, 2) != "0x") {
        return parse_integer(text, value);
    }

    std::string_view hex = text.substr(2);
    if (hex.empty()) {
        return Error::NumericParseError;
    }

    std::uint64_t result = 0;
    auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + hex.size(), result, 16);
    if (ec != std::errc() || ptr != hex.data() + hex.size()) {
        return Error::NumericParseError;
    }
    if (result > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return Error::NumericParseError;
    }

    value = static_cast<std::int64_t>(result);
    return Error::Ok;
}

Error parse_float(std::string_view text, double& value) noexcept {
    constexpr double infinity = std::numeric_limits<double>::infinity();

    bool negative = false;
    std::string_view body = text;
    if (!body.empty() && (body.front() == '+' || body.front() == '-')) {
        negative = body.front() == '-';
        body.remove_prefix(1);
    }

    if (equals_ignore_case(body, "inf") || equals_ignore_case(body, "infinity")) {
        value = negative ? -infinity : infinity;
        return Error::Ok;
    }
    if (equals_ignore_case(body, "nan")) {
        value = std::numeric_limits<double>::quiet_NaN();
        return Error::Ok;
    }
    if (!is_decimal_float(body)) {
        return Error::NumericParseError;
    }

    // from_chars is locale independent but takes no sign, so parse the body
    double result = 0.0;
    auto [ptr, ec] = std::from_chars(body.data(), body.data() + body.size(), result);
    if (ec == std::errc::result_out_of_range) {
        result = (decimal_scale(body) > 0) ? infinity : 0.0;
    } else if (ec != std::errc() || ptr != body.data() + body.size()) {
        return Error::NumericParseError;
    }

    value = negative ? -result : result;
    return Error::Ok;
}

bool is_valid_utf8(std::string_view text) noexcept {
    const auto* data = reinterpret_cast<const unsigned char*>(text.data());
    std::size_t len = text.size();
    std::size_t pos = 0;

    while (pos < len) {
        unsigned char c = data[pos];
        if (c < 0x80) {
            ++pos;
            continue;
        }

        if ((c & 0xE0) == 0xC0) {
            if (pos + 1 >= len || (data[pos + 1] & 0xC0) != 0x80 || c < 0xC2) {
                return false;
            }
            pos += 2;
        } else if ((c & 0xF0) == 0xE0) {
            if (pos + 2 >= len || (data[pos + 1] & 0xC0) != 0x80 ||
                (data[pos + 2] & 0xC0) != 0x80) {
                return false;
            }
            std::uint32_t cp = ((c & 0x0FU) << 12) | ((data[pos + 1] & 0x3FU) << 6) |
                               (data[pos + 2] & 0x3FU);
            if (cp < 0x800 || (cp >= 0xD800 && cp <= 0xDFFF)) {
                return false; // overlong or surrogate
            }
            pos += 3;
        } else if ((c & 0xF8) == 0xF0) {
            if (pos + 3 >= len || (data[pos + 1] & 0xC0) != 0x80 ||
                (data[pos + 2] & 0xC0) != 0x80 || (data[pos + 3] & 0xC0) != 0x80) {
                return false;
            }
            std::uint32_t cp = ((c & 0x07U) << 18) | ((data[pos + 1] & 0x3FU) << 12) |
                               ((data[pos + 2] & 0x3FU) << 6) | (data[pos + 3] & 0x3FU);
            if (cp < 0x10000 || cp > 0x10FFFF) {
                return false;
            }
            pos += 4;
        } else {
            return false;
        }
    }

    return true;
}

} // namespace jsonb
