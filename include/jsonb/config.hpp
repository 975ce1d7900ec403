/**
 * @file config.hpp
 * @brief JSONB decoder compile-time configuration.
 *
 * SQLite JSONB: binary encoding of JSON values used by SQLite 3.45+.
 *
 * @authors jsonb contributors
 *
 * @see https://sqlite.org/jsonb.html SQLite JSONB format
 */

#ifndef JSONB_CONFIG_HPP
#define JSONB_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace jsonb {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 0;
inline constexpr int VERSION_MINOR = 2;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Maximum nesting depth of arrays/objects accepted by default
#ifndef JSONB_MAX_DEPTH
#define JSONB_MAX_DEPTH 1000U
#endif

inline constexpr std::size_t MAX_DEPTH = JSONB_MAX_DEPTH;

/// Largest header: 1 type/selector byte + 8 size bytes
inline constexpr std::size_t MAX_HEADER_BYTES = 9U;

/// Size selectors 0-11 carry the payload size inline
inline constexpr std::uint8_t MAX_INLINE_SIZE = 11U;

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define JSONB_NO_EXCEPTIONS=1 to build without exceptions.
 * @{
 */
#ifndef JSONB_NO_EXCEPTIONS
#define JSONB_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace jsonb

#endif // JSONB_CONFIG_HPP
