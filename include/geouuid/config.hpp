/**
 * @file config.hpp
 * @brief GeoTemporal UUID compile-time configuration.
 *
 * Holds the version, the canonical bit layout widths and the reserved
 * UUID marker values.
 *
 * @par Canonical layout
 * 48-bit millisecond timestamp, 25-bit longitude, 24-bit latitude and a
 * 25-bit random tail. Identifiers produced with a 32-bit seconds timestamp
 * are a different format and are not decoded by this library.
 */

#ifndef GEOUUID_CONFIG_HPP
#define GEOUUID_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace geouuid {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Layout Constants
 * @{
 */

/// Identifier size
inline constexpr std::size_t IDENTIFIER_BYTES = 16U;
inline constexpr std::size_t IDENTIFIER_BITS = IDENTIFIER_BYTES * 8U;

/// Field widths in bits
inline constexpr std::size_t TIMESTAMP_BITS = 48U;
inline constexpr std::size_t LONGITUDE_BITS = 25U;
inline constexpr std::size_t LATITUDE_BITS = 24U;
inline constexpr std::size_t RANDOM_BITS = 25U;

/// Bits carrying payload (everything except the UUID markers)
inline constexpr std::size_t PAYLOAD_BITS =
    TIMESTAMP_BITS + LONGITUDE_BITS + LATITUDE_BITS + RANDOM_BITS;
inline constexpr std::size_t RESERVED_BITS = IDENTIFIER_BITS - PAYLOAD_BITS;

/// UUID version nibble, absolute bits 48-51
inline constexpr std::size_t VERSION_POSITION = 48U;
inline constexpr std::uint8_t VERSION_VALUE = 0b0111U;

/// UUID variant, absolute bits 64-65
inline constexpr std::size_t VARIANT_POSITION = 64U;
inline constexpr std::uint8_t VARIANT_VALUE = 0b10U;

/// Coordinate domains in degrees (closed intervals)
inline constexpr double LATITUDE_MIN = -90.0;
inline constexpr double LATITUDE_MAX = 90.0;
inline constexpr double LONGITUDE_MIN = -180.0;
inline constexpr double LONGITUDE_MAX = 180.0;

/// Canonical string length (32 hex digits and 4 hyphens)
inline constexpr std::size_t STRING_LENGTH = 36U;

/** @} */

static_assert(PAYLOAD_BITS == 122U, "payload must fill 122 bits");
static_assert(RESERVED_BITS == 6U, "six bits are reserved for UUID markers");

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define GEOUUID_NO_EXCEPTIONS=1 to disable exceptions (embedded and
 * WebAssembly builds).
 * @{
 */
#ifndef GEOUUID_NO_EXCEPTIONS
#define GEOUUID_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace geouuid

#endif // GEOUUID_CONFIG_HPP
