/**
 * @file bitreader.hpp
 * @brief Cursor over MSB-first bits of a byte buffer.
 *
 * Uses the same bit numbering as BitBuffer. unpack() walks an identifier
 * with it, one schedule slot per bit.
 */

#ifndef GEOUUID_BITREADER_HPP
#define GEOUUID_BITREADER_HPP

#include "config.hpp"

namespace geouuid {

class BitReader {
public:
    /**
     * @param data Source bytes, not owned; must outlive the reader
     * @param num_bits Number of readable bits starting at bit 0 of data
     */
    BitReader(const std::uint8_t* data, std::size_t num_bits) noexcept
        : data_(data), limit_(num_bits), cursor_(0) {}

    /**
     * @brief Read the bit under the cursor and advance.
     * @return 0 or 1, or -1 once the limit is reached
     */
    int read_bit() noexcept {
        if (cursor_ >= limit_) [[unlikely]] {
            return -1;
        }
        int bit = bit_at(cursor_);
        ++cursor_;
        return bit;
    }

    /// Advance without reading; stops at the limit
    void skip(std::size_t num_bits) noexcept {
        cursor_ += (num_bits < remaining()) ? num_bits : remaining();
    }

    [[nodiscard]] std::size_t remaining() const noexcept {
        return cursor_ < limit_ ? limit_ - cursor_ : 0;
    }

private:
    const std::uint8_t* data_;
    std::size_t limit_;
    std::size_t cursor_;

    int bit_at(std::size_t pos) const noexcept {
        return (data_[pos >> 3] >> (7U - (pos & 7U))) & 1;
    }
};

} // namespace geouuid

#endif // GEOUUID_BITREADER_HPP
