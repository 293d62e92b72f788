/**
 * @file codec.cpp
 * @brief GeoTemporal UUID encode and decode.
 */

#include <geouuid/codec.hpp>

namespace geouuid {

Error encode(double latitude, double longitude, Timestamp timestamp, std::uint64_t random,
             Identifier& out) noexcept {
    if (!coordinates_valid(latitude, longitude)) {
        return Error::OutOfRange;
    }

    FieldValues values{};
    values[field_index(Field::Timestamp)] = timestamp_field(timestamp);
    values[field_index(Field::Longitude)] = quantize_longitude(longitude);
    values[field_index(Field::Latitude)] = quantize_latitude(latitude);
    values[field_index(Field::Random)] = random & max_code(RANDOM_BITS);

    return pack(CANONICAL_SCHEDULE, values, out);
}

Decoded decode(const Identifier& id) noexcept {
    FieldValues values = unpack(CANONICAL_SCHEDULE, id);

    Decoded decoded;
    decoded.latitude = dequantize_latitude(values[field_index(Field::Latitude)]);
    decoded.longitude = dequantize_longitude(values[field_index(Field::Longitude)]);
    decoded.timestamp =
        from_millis(static_cast<std::int64_t>(values[field_index(Field::Timestamp)]));
    return decoded;
}

} // namespace geouuid
