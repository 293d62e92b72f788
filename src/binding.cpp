/**
 * @file binding.cpp
 * @brief Host-embedding entry points.
 */

#include <geouuid/binding.hpp>

#include <geouuid/codec.hpp>

namespace geouuid {

const Generator& default_generator() {
    static const Generator generator;
    return generator;
}

Error generate_uuid(const Generator& generator, double latitude, double longitude,
                    const TimeArgument& time, std::string& out) {
    Timestamp timestamp{};
    Error result = resolve_time(time, generator.clock(), timestamp);
    if (result != Error::Ok) {
        out = error_string(result);
        return result;
    }

    Identifier id;
    result = generator.generate(latitude, longitude, timestamp, id);
    if (result != Error::Ok) {
        out = error_string(result);
        return result;
    }

    out = id.to_string();
    return Error::Ok;
}

Error generate_uuid(double latitude, double longitude, const TimeArgument& time,
                    std::string& out) {
    return generate_uuid(default_generator(), latitude, longitude, time, out);
}

Error decode_uuid(std::string_view text, DecodedArray& out) noexcept {
    Identifier id;
    Error result = Identifier::parse(text, id);
    if (result != Error::Ok) {
        return result;
    }

    Decoded decoded = decode(id);
    out = {decoded.latitude, decoded.longitude,
           static_cast<double>(to_millis(decoded.timestamp))};
    return Error::Ok;
}

} // namespace geouuid
