/**
 * @file generator.hpp
 * @brief Identifier generation with injected clock and random source.
 *
 * Generator binds a Clock and a RandomSource at construction and forwards
 * to encode(). Supplying a fixed clock and a fixed random source makes
 * generation deterministic:
 *
 * @code
 * geouuid::Generator gen([] { return geouuid::from_millis(1609459200000); },
 *                        [] { return std::uint64_t{0x155aa55}; });
 * geouuid::Identifier id;
 * auto result = gen.generate(40.6892, -74.0445, id);
 * @endcode
 */

#ifndef GEOUUID_GENERATOR_HPP
#define GEOUUID_GENERATOR_HPP

#include <functional>
#include <optional>

#include "codec.hpp"
#include "config.hpp"
#include "error.hpp"
#include "identifier.hpp"
#include "timestamp.hpp"

namespace geouuid {

/// Injected entropy source; only the low RANDOM_BITS of each draw are used
using RandomSource = std::function<std::uint64_t()>;

/**
 * @brief Random source backed by a per-thread std::mt19937_64.
 *
 * Each thread seeds its own engine from std::random_device on first use,
 * so the returned source can be shared across threads.
 */
RandomSource default_random_source();

class Generator {
public:
    /**
     * @brief System clock and default random source.
     */
    Generator();

    Generator(Clock clock, RandomSource random);

    /**
     * @brief Generate at the current clock reading.
     *
     * @param latitude Degrees in [-90, 90]
     * @param longitude Degrees in [-180, 180]
     * @param[out] out Generated identifier
     * @return Error::Ok or Error::OutOfRange
     */
    Error generate(double latitude, double longitude, Identifier& out) const;

    /**
     * @brief Generate at a given instant.
     */
    Error generate(double latitude, double longitude, Timestamp timestamp,
                   Identifier& out) const;

#if !GEOUUID_NO_EXCEPTIONS
    /**
     * @brief Generate, throwing OutOfRangeException on invalid coordinates.
     *
     * @param timestamp Instant, or the clock reading when empty
     */
    Identifier make(double latitude, double longitude,
                    std::optional<Timestamp> timestamp = std::nullopt) const;
#endif

    [[nodiscard]] const Clock& clock() const noexcept {
        return clock_;
    }

private:
    Clock clock_;
    RandomSource random_;
};

} // namespace geouuid

#endif // GEOUUID_GENERATOR_HPP
