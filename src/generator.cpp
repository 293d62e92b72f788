/**
 * @file generator.cpp
 * @brief Identifier generation with injected clock and random source.
 */

#include <geouuid/generator.hpp>

#include <random>
#include <string>
#include <utility>

namespace geouuid {

RandomSource default_random_source() {
    return [] {
        thread_local std::mt19937_64 engine = [] {
            std::random_device device;
            std::seed_seq seed{device(), device(), device(), device()};
            return std::mt19937_64(seed);
        }();
        return static_cast<std::uint64_t>(engine());
    };
}

Generator::Generator() : Generator(system_clock(), default_random_source()) {}

Generator::Generator(Clock clock, RandomSource random)
    : clock_(std::move(clock)), random_(std::move(random)) {}

Error Generator::generate(double latitude, double longitude, Identifier& out) const {
    if (!clock_) {
        return Error::InvalidArg;
    }
    return generate(latitude, longitude, clock_(), out);
}

Error Generator::generate(double latitude, double longitude, Timestamp timestamp,
                          Identifier& out) const {
    if (!coordinates_valid(latitude, longitude)) {
        return Error::OutOfRange;
    }
    if (!random_) {
        return Error::InvalidArg;
    }
    return encode(latitude, longitude, timestamp, random_(), out);
}

#if !GEOUUID_NO_EXCEPTIONS
Identifier Generator::make(double latitude, double longitude,
                           std::optional<Timestamp> timestamp) const {
    Identifier id;
    Error result = timestamp ? generate(latitude, longitude, *timestamp, id)
                             : generate(latitude, longitude, id);
    if (result == Error::OutOfRange) {
        throw OutOfRangeException("Coordinates (" + std::to_string(latitude) + ", " +
                                  std::to_string(longitude) + "): " + error_string(result));
    }
    throw_if_error(result);
    return id;
}
#endif

} // namespace geouuid
