/**
 * @file test_edge_cases.cpp
 * @brief Edge case tests across quantization, layout and text handling.
 *
 * Tests boundary conditions, corner cases, and stress scenarios.
 */

#include <catch2/catch_test_macros.hpp>
#include <geouuid/geouuid.hpp>

#include <cmath>
#include <limits>
#include <random>
#include <string>

using namespace geouuid;

namespace {

constexpr std::int64_t NEW_YEAR_2021_MS = 1609459200000;
constexpr std::int64_t MAX_MS = (std::int64_t{1} << 48) - 1;

Identifier encode_ok(double lat, double lon, std::int64_t millis, std::uint64_t random) {
    Identifier id;
    REQUIRE(encode(lat, lon, from_millis(millis), random, id) == Error::Ok);
    return id;
}

} // namespace

// ============================================================================
// Quantization Edge Cases
// ============================================================================

TEST_CASE("Quantization edge cases", "[edge][quantize]") {
    SECTION("negative zero encodes like zero") {
        REQUIRE(encode_ok(-0.0, -0.0, 0, 0) == encode_ok(0.0, 0.0, 0, 0));
    }

    SECTION("subnormal coordinates encode like zero") {
        double tiny = std::numeric_limits<double>::denorm_min();
        REQUIRE(encode_ok(tiny, -tiny, 0, 0) == encode_ok(0.0, 0.0, 0, 0));
    }

    SECTION("domain ends map to the extreme codes") {
        REQUIRE(quantize_latitude(-90.0) == 0);
        REQUIRE(quantize_latitude(90.0) == max_code(LATITUDE_BITS));
        REQUIRE(quantize_longitude(-180.0) == 0);
        REQUIRE(quantize_longitude(180.0) == max_code(LONGITUDE_BITS));
    }

    SECTION("one step inside the ends stays inside") {
        double lat = std::nextafter(90.0, 0.0);
        double lon = std::nextafter(-180.0, 0.0);
        REQUIRE(quantize_latitude(lat) == max_code(LATITUDE_BITS));
        REQUIRE(quantize_longitude(lon) == 0);
    }

    SECTION("one step outside the ends is rejected") {
        Identifier id;
        REQUIRE(encode(std::nextafter(90.0, 91.0), 0.0, from_millis(0), 0, id) ==
                Error::OutOfRange);
        REQUIRE(encode(0.0, std::nextafter(-180.0, -181.0), from_millis(0), 0, id) ==
                Error::OutOfRange);
    }
}

TEST_CASE("Decoded coordinates re-encode to the same identifier", "[edge][quantize]") {
    std::mt19937_64 rng(7);

    for (int i = 0; i < 2000; ++i) {
        std::uint64_t lat_code = rng() & max_code(LATITUDE_BITS);
        std::uint64_t lon_code = rng() & max_code(LONGITUDE_BITS);
        double lat = dequantize_latitude(lat_code);
        double lon = dequantize_longitude(lon_code);

        REQUIRE(quantize_latitude(lat) == lat_code);
        REQUIRE(quantize_longitude(lon) == lon_code);

        Identifier first = encode_ok(lat, lon, NEW_YEAR_2021_MS + i, 0x42);
        Decoded decoded = decode(first);
        Identifier second = encode_ok(decoded.latitude, decoded.longitude,
                                      to_millis(decoded.timestamp), 0x42);
        REQUIRE(first == second);
    }
}

// ============================================================================
// Random Field Edge Cases
// ============================================================================

TEST_CASE("Random field edge cases", "[edge][random]") {
    SECTION("only the low 25 bits are used") {
        REQUIRE(encode_ok(0.0, 0.0, 0, ~std::uint64_t{0}) ==
                encode_ok(0.0, 0.0, 0, 0x1FFFFFF));
        REQUIRE(encode_ok(0.0, 0.0, 0, std::uint64_t{1} << 25) ==
                encode_ok(0.0, 0.0, 0, 0));
    }

    SECTION("random value does not move the coordinates") {
        Decoded low = decode(encode_ok(12.5, -33.25, NEW_YEAR_2021_MS, 0));
        Decoded high = decode(encode_ok(12.5, -33.25, NEW_YEAR_2021_MS, 0x1FFFFFF));
        REQUIRE(low.latitude == high.latitude);
        REQUIRE(low.longitude == high.longitude);
        REQUIRE(low.timestamp == high.timestamp);
    }
}

// ============================================================================
// Timestamp Edge Cases
// ============================================================================

TEST_CASE("Timestamp edge cases", "[edge][timestamp]") {
    SECTION("last representable millisecond") {
        Decoded decoded = decode(encode_ok(0.0, 0.0, MAX_MS, 0));
        REQUIRE(to_millis(decoded.timestamp) == MAX_MS);
    }

    SECTION("decoded instants past year 9999 format and parse back") {
        Identifier::Bytes bytes;
        bytes.fill(0xFF);
        Decoded decoded = decode(Identifier(bytes));

        std::string text = format_iso8601(decoded.timestamp);
        REQUIRE(text == "+10889-08-02T05:31:50.655Z");

        Timestamp ts;
        REQUIRE(parse_time(text, ts) == Error::Ok);
        REQUIRE(ts == decoded.timestamp);
    }

    SECTION("adjacent milliseconds order by time") {
        Identifier earlier = encode_ok(90.0, 180.0, NEW_YEAR_2021_MS, 0x1FFFFFF);
        Identifier later = encode_ok(-90.0, -180.0, NEW_YEAR_2021_MS + 1, 0);
        REQUIRE(earlier < later);
    }

    SECTION("epoch text resolves to zero") {
        Timestamp ts;
        REQUIRE(parse_time("1970-01-01T00:00:00.000Z", ts) == Error::Ok);
        REQUIRE(to_millis(ts) == 0);
        REQUIRE(parse_time("0", ts) == Error::Ok);
        REQUIRE(to_millis(ts) == 0);
    }

    SECTION("formatting and parsing agree") {
        Timestamp ts;
        std::string text = format_iso8601(from_millis(NEW_YEAR_2021_MS + 123));
        REQUIRE(parse_iso8601(text, ts) == Error::Ok);
        REQUIRE(to_millis(ts) == NEW_YEAR_2021_MS + 123);
    }

    SECTION("huge numeric times are rejected") {
        Timestamp ts;
        REQUIRE(millis_from_double(1e300, ts) == Error::InvalidTime);
        REQUIRE(millis_from_double(-1e300, ts) == Error::InvalidTime);
        REQUIRE(parse_millis("99999999999999999999999", ts) == Error::InvalidTime);
    }
}

// ============================================================================
// Text Edge Cases
// ============================================================================

TEST_CASE("Identifier text edge cases", "[edge][identifier]") {
    const char* canonical = "2896173e-7768-7c6f-bb90-7ce00155aa55";
    Identifier expected = Identifier::from_string(canonical);
    Identifier id;

    SECTION("uppercase and ungrouped forms decode the same") {
        REQUIRE(Identifier::parse("2896173E77687C6FBB907CE00155AA55", id) == Error::Ok);
        REQUIRE(id == expected);
    }

    SECTION("hyphens in unusual places are ignored") {
        REQUIRE(Identifier::parse("-2896-173e7768-7c6fbb90-7ce00155aa55-", id) == Error::Ok);
        REQUIRE(id == expected);
    }

    SECTION("empty and hyphen-only text is malformed") {
        REQUIRE(Identifier::parse("", id) == Error::MalformedInput);
        REQUIRE(Identifier::parse("------------------------------------", id) ==
                Error::MalformedInput);
    }

    SECTION("surrounding whitespace is malformed") {
        REQUIRE(Identifier::parse(std::string(" ") + canonical, id) == Error::MalformedInput);
        REQUIRE(Identifier::parse(std::string(canonical) + "\n", id) == Error::MalformedInput);
    }

    SECTION("33 hex digits are malformed") {
        REQUIRE(Identifier::parse(std::string(canonical) + "0", id) == Error::MalformedInput);
    }
}

// ============================================================================
// Stress
// ============================================================================

TEST_CASE("Randomized encode/decode stress", "[edge][stress]") {
    std::mt19937_64 rng(12345);
    std::uniform_real_distribution<double> lat_dist(LATITUDE_MIN, LATITUDE_MAX);
    std::uniform_real_distribution<double> lon_dist(LONGITUDE_MIN, LONGITUDE_MAX);

    for (int i = 0; i < 10000; ++i) {
        double lat = lat_dist(rng);
        double lon = lon_dist(rng);
        std::int64_t millis = static_cast<std::int64_t>(rng() & static_cast<std::uint64_t>(MAX_MS));

        Identifier id = encode_ok(lat, lon, millis, rng());
        Identifier reparsed;
        REQUIRE(Identifier::parse(id.to_string(), reparsed) == Error::Ok);
        REQUIRE(reparsed == id);

        Decoded decoded = decode(reparsed);
        REQUIRE(std::fabs(decoded.latitude - lat) <= LATITUDE_PRECISION + 1e-12);
        REQUIRE(std::fabs(decoded.longitude - lon) <= LONGITUDE_PRECISION + 1e-12);
        REQUIRE(to_millis(decoded.timestamp) == millis);
    }
}
