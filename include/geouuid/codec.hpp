/**
 * @file codec.hpp
 * @brief GeoTemporal UUID encode and decode.
 *
 * encode() quantizes the coordinates, packs timestamp, longitude and
 * latitude round-robin (timestamp first) followed by the random tail, and
 * writes the UUID version and variant markers. decode() walks the same
 * schedule backwards.
 *
 * Both functions are pure: the timestamp and random value are explicit
 * arguments. See Generator for clock and entropy injection.
 *
 * @par Precision
 * Latitude and longitude come back within quantization_bound() of the
 * input (about 5.4e-6 degrees for both). The timestamp is exact to the
 * millisecond for instants in [1970-01-01, 1970-01-01 + 2^48 ms).
 */

#ifndef GEOUUID_CODEC_HPP
#define GEOUUID_CODEC_HPP

#include "config.hpp"
#include "error.hpp"
#include "identifier.hpp"
#include "layout.hpp"
#include "quantize.hpp"
#include "timestamp.hpp"

namespace geouuid {

/**
 * @brief Values recovered from an identifier.
 */
struct Decoded {
    double latitude = 0.0;
    double longitude = 0.0;
    Timestamp timestamp{};
};

/// Maximum latitude error after a round trip
inline constexpr double LATITUDE_PRECISION =
    quantization_bound(LATITUDE_MIN, LATITUDE_MAX, LATITUDE_BITS);

/// Maximum longitude error after a round trip
inline constexpr double LONGITUDE_PRECISION =
    quantization_bound(LONGITUDE_MIN, LONGITUDE_MAX, LONGITUDE_BITS);

/**
 * @brief Check both coordinates lie in their closed domains.
 *
 * NaN is rejected.
 */
[[nodiscard]] inline bool coordinates_valid(double latitude, double longitude) noexcept {
    return latitude >= LATITUDE_MIN && latitude <= LATITUDE_MAX &&
           longitude >= LONGITUDE_MIN && longitude <= LONGITUDE_MAX;
}

/**
 * @brief Encode a coordinate, instant and random value.
 *
 * @param latitude Degrees in [-90, 90]
 * @param longitude Degrees in [-180, 180]
 * @param timestamp UTC instant; wraps modulo 2^48 ms
 * @param random Random bits; only the low RANDOM_BITS are used
 * @param[out] out Encoded identifier, unchanged on failure
 * @return Error::Ok or Error::OutOfRange
 */
Error encode(double latitude, double longitude, Timestamp timestamp, std::uint64_t random,
             Identifier& out) noexcept;

/**
 * @brief Decode an identifier.
 *
 * Total over all 128-bit values. Reserved bits are ignored.
 */
Decoded decode(const Identifier& id) noexcept;

} // namespace geouuid

#endif // GEOUUID_CODEC_HPP
