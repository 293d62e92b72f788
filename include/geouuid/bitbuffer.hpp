/**
 * @file bitbuffer.hpp
 * @brief Fixed-capacity MSB-first bit writer used to assemble identifiers.
 *
 * Absolute bit n of the output lives in byte n / 8 at mask 0x80 >> (n % 8),
 * the same numbering Identifier::get_bit() reads back.
 */

#ifndef GEOUUID_BITBUFFER_HPP
#define GEOUUID_BITBUFFER_HPP

#include "config.hpp"
#include "error.hpp"
#include <array>
#include <cstring>

namespace geouuid {

/**
 * @brief Bit writer over a zero-initialized byte array.
 *
 * @tparam MaxBytes Capacity in bytes (an identifier by default)
 *
 * No heap allocation. Unwritten trailing bits read back as zero.
 */
template <std::size_t MaxBytes = IDENTIFIER_BYTES>
class BitBuffer {
public:
    static_assert(MaxBytes > 0, "BitBuffer needs at least one byte");

    /// Capacity in bits
    static constexpr std::size_t MAX_BITS = MaxBytes * 8;

    constexpr BitBuffer() noexcept : bytes_{}, cursor_(0) {}

    [[nodiscard]] bool full() const noexcept { return cursor_ == MAX_BITS; }

    /**
     * @brief Write one bit at the cursor.
     *
     * @param bit Only the lowest bit is used
     * @return Error::Ok, or Error::InvalidArg when the buffer is full
     */
    Error append_bit(int bit) noexcept {
        if (full()) [[unlikely]] {
            return Error::InvalidArg;
        }
        if ((bit & 1) != 0) {
            bytes_[cursor_ >> 3] |= static_cast<std::uint8_t>(0x80U >> (cursor_ & 7U));
        }
        ++cursor_;
        return Error::Ok;
    }

    /**
     * @brief Copy the written bytes out.
     *
     * A partial final byte is copied with its unwritten bits zero.
     *
     * @param bytes Destination
     * @param max_bytes Destination capacity
     * @return Bytes copied
     */
    std::size_t to_bytes(std::uint8_t* bytes, std::size_t max_bytes) const noexcept {
        std::size_t used = (cursor_ + 7U) / 8U;
        std::size_t count = used < max_bytes ? used : max_bytes;
        if (count > 0) {
            std::memcpy(bytes, bytes_.data(), count);
        }
        return count;
    }

private:
    std::array<std::uint8_t, MaxBytes> bytes_;
    std::size_t cursor_;
};

} // namespace geouuid

#endif // GEOUUID_BITBUFFER_HPP
