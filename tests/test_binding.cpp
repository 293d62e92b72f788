/**
 * @file test_binding.cpp
 * @brief Tests for the host-embedding entry points and the C API.
 */

#include <catch2/catch_test_macros.hpp>
#include <geouuid/binding.hpp>
#include <geouuid/geouuid.h>

#include <cmath>
#include <cstring>
#include <string>

using namespace geouuid;

namespace {

constexpr std::int64_t NEW_YEAR_2021_MS = 1609459200000;
constexpr const char* STATUE_UUID = "2896173e-7768-7c6f-bb90-7ce00155aa55";

const Generator& fixed_generator() {
    static const Generator generator([] { return from_millis(NEW_YEAR_2021_MS); },
                                     [] { return std::uint64_t{0x155AA55}; });
    return generator;
}

} // namespace

TEST_CASE("generate_uuid resolves every time argument kind", "[binding]") {
    std::string out;

    SECTION("absent") {
        REQUIRE(generate_uuid(fixed_generator(), 40.6892, -74.0445, TimeArgument{}, out) ==
                Error::Ok);
        REQUIRE(out == STATUE_UUID);
    }

    SECTION("numeric milliseconds") {
        REQUIRE(generate_uuid(fixed_generator(), 40.6892, -74.0445,
                              TimeArgument{1609459200000.0}, out) == Error::Ok);
        REQUIRE(out == STATUE_UUID);
    }

    SECTION("numeric string milliseconds") {
        REQUIRE(generate_uuid(fixed_generator(), 40.6892, -74.0445,
                              TimeArgument{std::string("1609459200000")}, out) == Error::Ok);
        REQUIRE(out == STATUE_UUID);
    }

    SECTION("ISO-8601 string") {
        REQUIRE(generate_uuid(fixed_generator(), 40.6892, -74.0445,
                              TimeArgument{std::string("2021-01-01T00:00:00Z")}, out) ==
                Error::Ok);
        REQUIRE(out == STATUE_UUID);
    }
}

TEST_CASE("generate_uuid reports errors as messages", "[binding]") {
    std::string out;

    SECTION("out of range") {
        REQUIRE(generate_uuid(fixed_generator(), 95.0, 0.0, TimeArgument{}, out) ==
                Error::OutOfRange);
        REQUIRE(out == error_string(Error::OutOfRange));
    }

    SECTION("bad time string") {
        REQUIRE(generate_uuid(fixed_generator(), 0.0, 0.0, TimeArgument{std::string("noon")},
                              out) == Error::InvalidTime);
        REQUIRE(out == error_string(Error::InvalidTime));
    }

    SECTION("non-finite numeric time") {
        REQUIRE(generate_uuid(fixed_generator(), 0.0, 0.0, TimeArgument{NAN}, out) ==
                Error::InvalidTime);
    }
}

TEST_CASE("decode_uuid returns latitude, longitude and milliseconds", "[binding]") {
    DecodedArray values{};

    REQUIRE(decode_uuid(STATUE_UUID, values) == Error::Ok);
    REQUIRE(std::fabs(values[0] - 40.6892) < 1e-4);
    REQUIRE(std::fabs(values[1] - (-74.0445)) < 1e-4);
    REQUIRE(values[2] == static_cast<double>(NEW_YEAR_2021_MS));

    REQUIRE(decode_uuid("2896173e77687c6fbb907ce00155aa55", values) == Error::Ok);
    REQUIRE(decode_uuid("2896173e", values) == Error::MalformedInput);
}

TEST_CASE("Default generator produces current identifiers", "[binding]") {
    std::string out;
    Timestamp before = system_now();
    REQUIRE(generate_uuid(1.0, 2.0, TimeArgument{}, out) == Error::Ok);

    DecodedArray values{};
    REQUIRE(decode_uuid(out, values) == Error::Ok);
    REQUIRE(values[2] >= static_cast<double>(to_millis(before)));
}

TEST_CASE("C API generate", "[binding][capi]") {
    char out[GEOUUID_STRING_LENGTH + 1];

    SECTION("ISO-8601 time") {
        REQUIRE(geouuid_generate(40.6892, -74.0445, "2021-01-01T00:00:00Z", out, sizeof(out)) ==
                GEOUUID_OK);
        REQUIRE(std::strlen(out) == GEOUUID_STRING_LENGTH);

        double values[3] = {0.0, 0.0, 0.0};
        REQUIRE(geouuid_decode(out, values, nullptr, 0) == GEOUUID_OK);
        REQUIRE(values[2] == static_cast<double>(NEW_YEAR_2021_MS));
    }

    SECTION("numeric milliseconds") {
        REQUIRE(geouuid_generate_ms(40.6892, -74.0445, 1609459200000.0, out, sizeof(out)) ==
                GEOUUID_OK);
        double values[3] = {0.0, 0.0, 0.0};
        REQUIRE(geouuid_decode(out, values, nullptr, 0) == GEOUUID_OK);
        REQUIRE(values[2] == static_cast<double>(NEW_YEAR_2021_MS));
    }

    SECTION("null time means now") {
        REQUIRE(geouuid_generate(0.0, 0.0, nullptr, out, sizeof(out)) == GEOUUID_OK);
        REQUIRE(std::strlen(out) == GEOUUID_STRING_LENGTH);
    }

    SECTION("error message replaces the identifier") {
        REQUIRE(geouuid_generate(0.0, 190.0, "0", out, sizeof(out)) ==
                GEOUUID_ERROR_OUT_OF_RANGE);
        // Truncated to the buffer
        REQUIRE(std::strlen(out) == GEOUUID_STRING_LENGTH);
        REQUIRE(std::strncmp(out, error_string(Error::OutOfRange), GEOUUID_STRING_LENGTH) == 0);

        REQUIRE(geouuid_generate(0.0, 0.0, "later", out, sizeof(out)) ==
                GEOUUID_ERROR_INVALID_TIME);
    }

    SECTION("buffer too small") {
        char small[8];
        REQUIRE(geouuid_generate(0.0, 0.0, "0", small, sizeof(small)) ==
                GEOUUID_ERROR_INVALID_ARG);
        REQUIRE(std::strlen(small) == 7);
        REQUIRE(geouuid_generate(0.0, 0.0, "0", nullptr, 64) == GEOUUID_ERROR_INVALID_ARG);
    }
}

TEST_CASE("C API decode", "[binding][capi]") {
    double values[3] = {0.0, 0.0, 0.0};
    char err[128];

    REQUIRE(geouuid_decode(STATUE_UUID, values, err, sizeof(err)) == GEOUUID_OK);
    REQUIRE(std::fabs(values[0] - 40.6892) < 1e-4);

    REQUIRE(geouuid_decode("zz", values, err, sizeof(err)) == GEOUUID_ERROR_MALFORMED_INPUT);
    REQUIRE(std::string(err) == error_string(Error::MalformedInput));

    REQUIRE(geouuid_decode(nullptr, values, err, sizeof(err)) == GEOUUID_ERROR_INVALID_ARG);
    REQUIRE(geouuid_decode(STATUE_UUID, nullptr, nullptr, 0) == GEOUUID_ERROR_INVALID_ARG);
}

TEST_CASE("C API error strings and version", "[binding][capi]") {
    REQUIRE(std::string(geouuid_error_string(GEOUUID_OK)) == "Success");
    REQUIRE(std::string(geouuid_error_string(GEOUUID_ERROR_MALFORMED_INPUT)) ==
            error_string(Error::MalformedInput));
    REQUIRE(std::string(geouuid_error_string(-99)) == "Unknown error");
    REQUIRE(std::string(geouuid_version()) == "1.0.0");
}
