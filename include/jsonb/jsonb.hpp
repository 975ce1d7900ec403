/**
 * @file jsonb.hpp
 * @brief SQLite JSONB decoding API.
 *
 * Decodes SQLite's binary JSON encoding into a Value tree:
 *
 * @code
 * jsonb::Value value;
 * if (jsonb::decode(blob, blob_size, value) == jsonb::Error::Ok) {
 *     std::puts(jsonb::to_json(value).c_str());
 * }
 * @endcode
 *
 * @authors jsonb contributors
 *
 * @see https://sqlite.org/jsonb.html SQLite JSONB format
 */

#ifndef JSONB_HPP
#define JSONB_HPP

#include "bytereader.hpp"
#include "config.hpp"
#include "decoder.hpp"
#include "error.hpp"
#include "header.hpp"
#include "scalar.hpp"
#include "value.hpp"
#include "writer.hpp"

namespace jsonb {

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "0.2.0";
}

} // namespace jsonb

#endif // JSONB_HPP
