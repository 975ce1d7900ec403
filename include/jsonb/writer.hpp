/**
 * @file writer.hpp
 * @brief Render a decoded Value as JSON text.
 *
 * @authors jsonb contributors
 */

#ifndef JSONB_WRITER_HPP
#define JSONB_WRITER_HPP

#include "config.hpp"
#include "value.hpp"

#include <string>

namespace jsonb {

/**
 * @brief Output formatting options.
 */
struct WriteOptions {
    /// Spaces per nesting level; 0 writes compact text like SQLite's json()
    int indent = 0;
};

/**
 * @brief Render a value as JSON text.
 *
 * Non-finite floats have no JSON form: infinity is written as 9e999
 * (as SQLite does) and NaN as null.
 *
 * @param value Value to render
 * @param options Formatting options
 * @return JSON text
 */
std::string to_json(const Value& value, const WriteOptions& options = {});

/**
 * @brief Append a JSON string literal (quoted and escaped) to out.
 */
void write_string(std::string& out, const std::string& text);

} // namespace jsonb

#endif // JSONB_WRITER_HPP
