/**
 * @file identifier.hpp
 * @brief 128-bit GeoTemporal identifier value.
 *
 * An Identifier owns 16 big-endian bytes. Absolute bit 0 is the most
 * significant bit of byte 0, bit 127 the least significant bit of byte 15.
 * Identifiers compare lexicographically on their bytes.
 *
 * @par Text form
 * Lowercase hex grouped 8-4-4-4-12:
 * @code
 * 0163a6e5-1c3f-7b2d-8e4a-90c1d7f25b66
 * @endcode
 */

#ifndef GEOUUID_IDENTIFIER_HPP
#define GEOUUID_IDENTIFIER_HPP

#include <array>
#include <string>
#include <string_view>

#include "config.hpp"
#include "error.hpp"

namespace geouuid {

class Identifier {
public:
    using Bytes = std::array<std::uint8_t, IDENTIFIER_BYTES>;

    /**
     * @brief Default constructor - all 128 bits zero.
     */
    constexpr Identifier() noexcept : bytes_{} {}

    /**
     * @brief Construct from exactly 16 big-endian bytes.
     */
    constexpr explicit Identifier(const Bytes& bytes) noexcept : bytes_(bytes) {}

    /**
     * @brief Construct from a raw byte buffer.
     *
     * @param data Source bytes
     * @param size Number of bytes at @p data
     * @param[out] out Parsed identifier
     * @return Error::MalformedInput unless @p size is 16
     */
    static Error from_bytes(const std::uint8_t* data, std::size_t size, Identifier& out) noexcept;

    /**
     * @brief Parse the grouped or ungrouped hex form.
     *
     * Every hyphen is stripped before decoding; the rest must be exactly
     * 32 hex digits of either case.
     *
     * @param text Identifier text
     * @param[out] out Parsed identifier, unchanged on failure
     * @return Error::Ok or Error::MalformedInput
     */
    static Error parse(std::string_view text, Identifier& out) noexcept;

#if !GEOUUID_NO_EXCEPTIONS
    /**
     * @brief Parse, throwing MalformedInputException on failure.
     */
    static Identifier from_string(std::string_view text);
#endif

    /**
     * @brief Canonical lowercase 8-4-4-4-12 text.
     */
    [[nodiscard]] std::string to_string() const;

    /**
     * @brief Write the canonical text without allocating.
     *
     * @param out Destination, at least STRING_LENGTH + 1 bytes
     * @param size Size of @p out
     * @return Error::InvalidArg if @p out is too small
     */
    Error format(char* out, std::size_t size) const noexcept;

    /**
     * @brief Get bit at an absolute position.
     *
     * @param pos Absolute position (0 = MSB of byte 0)
     * @return Bit value (0 or 1), 0 when out of range
     */
    [[nodiscard]] int get_bit(std::size_t pos) const noexcept {
        if (pos >= IDENTIFIER_BITS) [[unlikely]]
            return 0;
        return (bytes_[pos >> 3] >> (7U - (pos & 7U))) & 1;
    }

    [[nodiscard]] const Bytes& bytes() const noexcept {
        return bytes_;
    }

    [[nodiscard]] const std::uint8_t* data() const noexcept {
        return bytes_.data();
    }

    [[nodiscard]] bool operator==(const Identifier& other) const noexcept {
        return bytes_ == other.bytes_;
    }

    [[nodiscard]] bool operator!=(const Identifier& other) const noexcept {
        return !(*this == other);
    }

    [[nodiscard]] bool operator<(const Identifier& other) const noexcept {
        return bytes_ < other.bytes_;
    }

    [[nodiscard]] bool operator>(const Identifier& other) const noexcept {
        return other < *this;
    }

    [[nodiscard]] bool operator<=(const Identifier& other) const noexcept {
        return !(other < *this);
    }

    [[nodiscard]] bool operator>=(const Identifier& other) const noexcept {
        return !(*this < other);
    }

private:
    Bytes bytes_;
};

} // namespace geouuid

#endif // GEOUUID_IDENTIFIER_HPP
