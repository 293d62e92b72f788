/**
 * @file timestamp.hpp
 * @brief Timestamp type, time-argument parsing and formatting.
 *
 * The codec only sees Timestamp, a UTC instant with millisecond
 * resolution. Textual and numeric time arguments are resolved to a
 * Timestamp here, once, before reaching the codec.
 *
 * Accepted ISO-8601 / RFC 3339 form:
 * @code
 *   YYYY-MM-DD(T|t| )HH:MM:SS[.fraction](Z|z|+HH:MM|-HH:MM)
 * @endcode
 * Fractions finer than a millisecond are truncated.
 */

#ifndef GEOUUID_TIMESTAMP_HPP
#define GEOUUID_TIMESTAMP_HPP

#include <chrono>
#include <functional>
#include <string>
#include <string_view>
#include <variant>

#include "config.hpp"
#include "error.hpp"

namespace geouuid {

/// UTC instant, milliseconds since the Unix epoch
using Timestamp = std::chrono::sys_time<std::chrono::milliseconds>;

/// Injected time source
using Clock = std::function<Timestamp()>;

/**
 * @brief Time argument as received from a host.
 *
 * - std::monostate: absent, use the clock
 * - double: milliseconds since the epoch
 * - std::string: integer milliseconds or ISO-8601 text
 */
using TimeArgument = std::variant<std::monostate, double, std::string>;

/**
 * @brief Current UTC instant, truncated to milliseconds.
 */
Timestamp system_now() noexcept;

/**
 * @brief Clock reading the system clock.
 */
Clock system_clock();

/**
 * @brief Build a Timestamp from milliseconds since the epoch.
 */
[[nodiscard]] constexpr Timestamp from_millis(std::int64_t millis) noexcept {
    return Timestamp{std::chrono::milliseconds{millis}};
}

[[nodiscard]] constexpr std::int64_t to_millis(Timestamp ts) noexcept {
    return ts.time_since_epoch().count();
}

/**
 * @brief Timestamp field value: two's complement milliseconds masked to
 *        TIMESTAMP_BITS. Instants outside the field wrap.
 */
[[nodiscard]] constexpr std::uint64_t timestamp_field(Timestamp ts) noexcept {
    return static_cast<std::uint64_t>(to_millis(ts)) &
           ((std::uint64_t{1} << TIMESTAMP_BITS) - 1U);
}

/**
 * @brief Parse a signed integer count of milliseconds.
 *
 * @param text Decimal digits with optional leading sign
 * @param[out] out Parsed instant
 * @return Error::Ok or Error::InvalidTime
 */
Error parse_millis(std::string_view text, Timestamp& out) noexcept;

/**
 * @brief Parse an ISO-8601 / RFC 3339 date-time with offset.
 *
 * The year is four digits, or a sign followed by four to six digits
 * (e.g. +10889). Dates are proleptic Gregorian.
 *
 * @param text Date-time text
 * @param[out] out Parsed instant (UTC)
 * @return Error::Ok or Error::InvalidTime
 */
Error parse_iso8601(std::string_view text, Timestamp& out) noexcept;

/**
 * @brief Parse integer milliseconds, falling back to ISO-8601.
 */
Error parse_time(std::string_view text, Timestamp& out) noexcept;

/**
 * @brief Convert a numeric millisecond value, truncating toward zero.
 *
 * @return Error::InvalidTime for NaN, infinities and values outside int64
 */
Error millis_from_double(double millis, Timestamp& out) noexcept;

/**
 * @brief Resolve a host time argument to an instant.
 *
 * @param argument Polymorphic time argument
 * @param clock Clock read when the argument is absent
 * @param[out] out Resolved instant
 * @return Error::Ok or Error::InvalidTime
 */
Error resolve_time(const TimeArgument& argument, const Clock& clock, Timestamp& out);

/**
 * @brief Format as YYYY-MM-DDTHH:MM:SS.mmmZ.
 *
 * Years outside 0000-9999 are written with a sign (+10889, -0001). Every
 * int64 millisecond count is accepted; output for years within six digits
 * parses back with parse_iso8601().
 */
std::string format_iso8601(Timestamp ts);

} // namespace geouuid

#endif // GEOUUID_TIMESTAMP_HPP
