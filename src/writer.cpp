/**
 * @file writer.cpp
 * @brief JSON text rendering.
 */

#include <jsonb/writer.hpp>

#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstring>

namespace jsonb {

namespace {

void write_newline(std::string& out, int indent, std::size_t level) {
    out.push_back('\n');
    out.append(static_cast<std::size_t>(indent) * level, ' ');
}

void write_int(std::string& out, std::int64_t number) {
    char buf[24];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), number);
    out.append(buf, ptr);
}

void write_float(std::string& out, double number) {
    if (std::isnan(number)) {
        out += "null";
        return;
    }
    if (std::isinf(number)) {
        out += (number < 0) ? "-9e999" : "9e999";
        return;
    }

    char buf[32];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), number);
    out.append(buf, ptr);

    // Keep floats distinguishable from integers: 5.0 not 5
    if (std::memchr(buf, '.', static_cast<std::size_t>(ptr - buf)) == nullptr &&
        std::memchr(buf, 'e', static_cast<std::size_t>(ptr - buf)) == nullptr) {
        out += ".0";
    }
}

void write_value(std::string& out, const Value& value, int indent, std::size_t level) {
    switch (value.kind()) {
    case Kind::Null:
        out += "null";
        break;
    case Kind::Bool:
        out += value.as_bool() ? "true" : "false";
        break;
    case Kind::Int:
        write_int(out, value.as_int());
        break;
    case Kind::Float:
        write_float(out, value.as_float());
        break;
    case Kind::Text:
        write_string(out, value.as_text());
        break;
    case Kind::Array: {
        const auto& elements = value.as_array();
        out.push_back('[');
        for (std::size_t i = 0; i < elements.size(); ++i) {
            if (i > 0) {
                out.push_back(',');
            }
            if (indent > 0) {
                write_newline(out, indent, level + 1);
            }
            write_value(out, elements[i], indent, level + 1);
        }
        if (indent > 0 && !elements.empty()) {
            write_newline(out, indent, level);
        }
        out.push_back(']');
    } break;
    case Kind::Object: {
        const auto& members = value.as_object();
        out.push_back('{');
        for (std::size_t i = 0; i < members.size(); ++i) {
            if (i > 0) {
                out.push_back(',');
            }
            if (indent > 0) {
                write_newline(out, indent, level + 1);
            }
            write_string(out, members[i].key);
            out += (indent > 0) ? ": " : ":";
            write_value(out, members[i].value, indent, level + 1);
        }
        if (indent > 0 && !members.empty()) {
            write_newline(out, indent, level);
        }
        out.push_back('}');
    } break;
    }
}

} // namespace

void write_string(std::string& out, const std::string& text) {
    out.push_back('"');
    for (unsigned char c : text) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (c <= 0x1F) {
                char buf[7];
                std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                out += buf;
            } else {
                out.push_back(static_cast<char>(c));
            }
        }
    }
    out.push_back('"');
}

std::string to_json(const Value& value, const WriteOptions& options) {
    std::string out;
    out.reserve(128);
    write_value(out, value, options.indent, 0);
    return out;
}

} // namespace jsonb
