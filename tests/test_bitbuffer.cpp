/**
 * @file test_bitbuffer.cpp
 * @brief Unit tests for the identifier bit writer.
 */

#include <catch2/catch_test_macros.hpp>
#include <geouuid/bitbuffer.hpp>

#include <initializer_list>

using namespace geouuid;

namespace {

template <std::size_t N>
void append_pattern(BitBuffer<N>& bb, std::initializer_list<int> bits) {
    for (int bit : bits) {
        REQUIRE(bb.append_bit(bit) == Error::Ok);
    }
}

} // namespace

TEST_CASE("BitBuffer starts empty", "[bitbuffer]") {
    BitBuffer<> bb;
    REQUIRE(BitBuffer<>::MAX_BITS == IDENTIFIER_BITS);
    REQUIRE_FALSE(bb.full());

    std::uint8_t output[IDENTIFIER_BYTES] = {0};
    REQUIRE(bb.to_bytes(output, sizeof(output)) == 0);
}

TEST_CASE("BitBuffer writes MSB-first", "[bitbuffer]") {
    BitBuffer<2> bb;
    append_pattern(bb, {0, 1, 1, 1, 0, 0, 1, 0, 1});

    std::uint8_t output[2] = {0xFF, 0xFF};
    REQUIRE(bb.to_bytes(output, 2) == 2);
    REQUIRE(output[0] == 0x72);
    // Unwritten tail of the partial byte is zero
    REQUIRE(output[1] == 0x80);
}

TEST_CASE("BitBuffer uses only the low bit of its argument", "[bitbuffer]") {
    BitBuffer<1> bb;
    append_pattern(bb, {2, 3, -1, 4});

    std::uint8_t output[1] = {0};
    bb.to_bytes(output, 1);
    REQUIRE(output[0] == 0x60); // 0110
}

TEST_CASE("BitBuffer rejects writes past capacity", "[bitbuffer]") {
    BitBuffer<1> bb;
    append_pattern(bb, {1, 1, 1, 1, 1, 1, 1, 1});

    REQUIRE(bb.full());
    REQUIRE(bb.append_bit(0) == Error::InvalidArg);

    std::uint8_t output[2] = {0, 0xAA};
    REQUIRE(bb.to_bytes(output, 2) == 1);
    REQUIRE(output[0] == 0xFF);
    REQUIRE(output[1] == 0xAA);
}

TEST_CASE("BitBuffer fills a whole identifier", "[bitbuffer]") {
    BitBuffer<> bb;
    for (std::size_t i = 0; i < IDENTIFIER_BITS; ++i) {
        // 1 on every bit index divisible by 3
        REQUIRE(bb.append_bit(i % 3 == 0 ? 1 : 0) == Error::Ok);
    }
    REQUIRE(bb.full());

    std::uint8_t output[IDENTIFIER_BYTES] = {0};
    REQUIRE(bb.to_bytes(output, sizeof(output)) == IDENTIFIER_BYTES);
    REQUIRE(output[0] == 0x92);  // 1001 0010
    REQUIRE(output[1] == 0x49);  // 0100 1001
    REQUIRE(output[2] == 0x24);  // 0010 0100
    REQUIRE(output[15] == 0x92); // bits 120..127, 120 % 3 == 0
}

TEST_CASE("BitBuffer to_bytes truncates to the destination", "[bitbuffer]") {
    BitBuffer<4> bb;
    for (int i = 0; i < 24; ++i) {
        REQUIRE(bb.append_bit(1) == Error::Ok);
    }

    std::uint8_t output[2] = {0};
    REQUIRE(bb.to_bytes(output, 2) == 2);
    REQUIRE(output[0] == 0xFF);
    REQUIRE(output[1] == 0xFF);
}
