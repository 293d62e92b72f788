/**
 * @file quantize.hpp
 * @brief Linear fixed-point quantization of bounded coordinates.
 *
 * A value v in the closed range [min, max] maps to
 * round((v - min) / (max - min) * (2^W - 1)), so min maps to 0 and max to
 * the all-ones code. The rounding error is at most
 * (max - min) / (2 * (2^W - 1)).
 */

#ifndef GEOUUID_QUANTIZE_HPP
#define GEOUUID_QUANTIZE_HPP

#include <cmath>

#include "config.hpp"

namespace geouuid {

/**
 * @brief Largest code of a width-bit field.
 */
[[nodiscard]] constexpr std::uint64_t max_code(std::size_t width) noexcept {
    return (width >= 64) ? ~std::uint64_t{0} : (std::uint64_t{1} << width) - 1U;
}

/**
 * @brief Worst-case absolute error of quantize() followed by dequantize().
 */
[[nodiscard]] constexpr double quantization_bound(double min, double max,
                                                  std::size_t width) noexcept {
    return (max - min) / (2.0 * static_cast<double>(max_code(width)));
}

/**
 * @brief Quantize a value already known to lie in [min, max].
 *
 * @param value Value to quantize
 * @param min Lower bound of the domain
 * @param max Upper bound of the domain
 * @param width Code width in bits (1-53)
 * @return Code in [0, 2^width - 1]
 */
[[nodiscard]] inline std::uint64_t quantize(double value, double min, double max,
                                            std::size_t width) noexcept {
    double scale = static_cast<double>(max_code(width));
    double normalized = (value - min) / (max - min);
    return static_cast<std::uint64_t>(std::llround(normalized * scale));
}

/**
 * @brief Map a code back to the domain.
 *
 * Codes above 2^width - 1 are masked to the width first.
 */
[[nodiscard]] inline double dequantize(std::uint64_t code, double min, double max,
                                       std::size_t width) noexcept {
    double scale = static_cast<double>(max_code(width));
    return (static_cast<double>(code & max_code(width)) / scale) * (max - min) + min;
}

[[nodiscard]] inline std::uint64_t quantize_latitude(double latitude) noexcept {
    return quantize(latitude, LATITUDE_MIN, LATITUDE_MAX, LATITUDE_BITS);
}

[[nodiscard]] inline std::uint64_t quantize_longitude(double longitude) noexcept {
    return quantize(longitude, LONGITUDE_MIN, LONGITUDE_MAX, LONGITUDE_BITS);
}

[[nodiscard]] inline double dequantize_latitude(std::uint64_t code) noexcept {
    return dequantize(code, LATITUDE_MIN, LATITUDE_MAX, LATITUDE_BITS);
}

[[nodiscard]] inline double dequantize_longitude(std::uint64_t code) noexcept {
    return dequantize(code, LONGITUDE_MIN, LONGITUDE_MAX, LONGITUDE_BITS);
}

} // namespace geouuid

#endif // GEOUUID_QUANTIZE_HPP
