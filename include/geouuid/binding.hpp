/**
 * @file binding.hpp
 * @brief Host-embedding entry points.
 *
 * Marshaling layer for non-native hosts (WebAssembly, FFI). Results come
 * back as strings and plain arrays; failures carry a readable message in
 * place of the value. The C ABI in geouuid.h forwards here.
 */

#ifndef GEOUUID_BINDING_HPP
#define GEOUUID_BINDING_HPP

#include <array>
#include <string>
#include <string_view>

#include "error.hpp"
#include "generator.hpp"
#include "timestamp.hpp"

namespace geouuid {

/// [latitude, longitude, timestamp_ms]
using DecodedArray = std::array<double, 3>;

/**
 * @brief Process-wide generator (system clock, default random source).
 */
const Generator& default_generator();

/**
 * @brief Generate the canonical string for a host time argument.
 *
 * @param generator Clock and random source
 * @param latitude Degrees in [-90, 90]
 * @param longitude Degrees in [-180, 180]
 * @param time Absent, numeric ms, numeric-string ms or ISO-8601 text
 * @param[out] out Canonical string on success, error message on failure
 * @return Error::Ok, Error::OutOfRange or Error::InvalidTime
 */
Error generate_uuid(const Generator& generator, double latitude, double longitude,
                    const TimeArgument& time, std::string& out);

Error generate_uuid(double latitude, double longitude, const TimeArgument& time,
                    std::string& out);

/**
 * @brief Decode identifier text to [latitude, longitude, timestamp_ms].
 *
 * @param text Grouped or ungrouped hex identifier
 * @param[out] out Decoded values
 * @return Error::Ok or Error::MalformedInput
 */
Error decode_uuid(std::string_view text, DecodedArray& out) noexcept;

} // namespace geouuid

#endif // GEOUUID_BINDING_HPP
