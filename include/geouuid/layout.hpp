/**
 * @file layout.hpp
 * @brief Declarative identifier bit layout and generic pack/unpack.
 *
 * A layout is data: an ordered list of interleaved (field, width) segments,
 * a list of tail segments appended after the interleaved block, and a set
 * of reserved absolute positions holding constant bits. make_schedule()
 * compiles a layout into one Slot per absolute identifier bit; pack() and
 * unpack() both walk that same schedule.
 *
 * @par Interleaving
 * The first interleaved segment is the widest and sets the number of
 * rounds R. In round r (bit index i = R-1-r of the first segment) each
 * segment of width W contributes its bit i - (R - W) when that index is
 * non-negative. Every segment's MSB is emitted in the first round.
 *
 * @par Canonical schedule (first stream bits)
 * @code
 *   stream:  T47 O24 L23 T46 O23 L22 ... T24 O1 L0 T23 O0 T22 ... T0 R24 ... R0
 * @endcode
 * Stream bit k lands at the k-th non-reserved absolute position.
 */

#ifndef GEOUUID_LAYOUT_HPP
#define GEOUUID_LAYOUT_HPP

#include <array>

#include "bitbuffer.hpp"
#include "bitreader.hpp"
#include "config.hpp"
#include "error.hpp"
#include "identifier.hpp"

namespace geouuid {

/**
 * @brief Logical fields carried by the payload.
 */
enum class Field : std::uint8_t { Timestamp = 0, Longitude = 1, Latitude = 2, Random = 3 };

inline constexpr std::size_t NUM_FIELDS = 4U;

/// Field values indexed by Field, right-justified
using FieldValues = std::array<std::uint64_t, NUM_FIELDS>;

[[nodiscard]] constexpr std::size_t field_index(Field field) noexcept {
    return static_cast<std::size_t>(field);
}

struct Segment {
    Field field = Field::Timestamp;
    std::size_t width = 0;
};

struct ReservedBit {
    std::size_t position = 0;
    std::uint8_t value = 0;
};

/**
 * @brief Source of one absolute identifier bit.
 */
struct Slot {
    bool reserved = false;
    std::uint8_t value = 0; ///< Constant bit when reserved
    Field field = Field::Timestamp;
    std::uint8_t bit = 0; ///< Bit index within the field (0 = LSB)
};

using Schedule = std::array<Slot, IDENTIFIER_BITS>;

/**
 * @brief Bit layout description.
 *
 * @tparam NumInterleaved Number of round-robin segments
 * @tparam NumTail Number of contiguous tail segments
 * @tparam NumReserved Number of reserved positions
 */
template <std::size_t NumInterleaved, std::size_t NumTail, std::size_t NumReserved>
struct Layout {
    std::array<Segment, NumInterleaved> interleaved;
    std::array<Segment, NumTail> tail;
    std::array<ReservedBit, NumReserved> reserved;

    /**
     * @brief Number of interleaving rounds (width of the leading segment).
     */
    [[nodiscard]] constexpr std::size_t rounds() const noexcept {
        return NumInterleaved > 0 ? interleaved[0].width : 0;
    }

    [[nodiscard]] constexpr std::size_t payload_bits() const noexcept {
        std::size_t total = 0;
        for (const auto& segment : interleaved) {
            total += segment.width;
        }
        for (const auto& segment : tail) {
            total += segment.width;
        }
        return total;
    }

    /**
     * @brief Width of a field, 0 if the layout does not carry it.
     */
    [[nodiscard]] constexpr std::size_t width(Field field) const noexcept {
        for (const auto& segment : interleaved) {
            if (segment.field == field) {
                return segment.width;
            }
        }
        for (const auto& segment : tail) {
            if (segment.field == field) {
                return segment.width;
            }
        }
        return 0;
    }

    [[nodiscard]] constexpr bool is_reserved(std::size_t position) const noexcept {
        for (const auto& r : reserved) {
            if (r.position == position) {
                return true;
            }
        }
        return false;
    }

    /**
     * @brief Check the layout fills the identifier exactly.
     *
     * Requires distinct in-range reserved positions, no segment wider than
     * the leading one or 64 bits, and payload + reserved == 128.
     */
    [[nodiscard]] constexpr bool valid() const noexcept {
        for (std::size_t i = 0; i < NumReserved; ++i) {
            if (reserved[i].position >= IDENTIFIER_BITS || reserved[i].value > 1) {
                return false;
            }
            for (std::size_t j = i + 1; j < NumReserved; ++j) {
                if (reserved[i].position == reserved[j].position) {
                    return false;
                }
            }
        }
        for (const auto& segment : interleaved) {
            if (segment.width == 0 || segment.width > rounds() || segment.width > 64) {
                return false;
            }
        }
        for (const auto& segment : tail) {
            if (segment.width == 0 || segment.width > 64) {
                return false;
            }
        }
        return payload_bits() + NumReserved == IDENTIFIER_BITS;
    }
};

/**
 * @brief Compile a layout into a per-position schedule.
 *
 * The layout must satisfy Layout::valid().
 */
template <std::size_t NI, std::size_t NT, std::size_t NR>
constexpr Schedule make_schedule(const Layout<NI, NT, NR>& layout) noexcept {
    // Payload stream in emission order
    std::array<Slot, IDENTIFIER_BITS> stream{};
    std::size_t k = 0;

    const std::size_t rounds = layout.rounds();
    for (std::size_t r = 0; r < rounds; ++r) {
        std::size_t i = rounds - 1 - r;
        for (const auto& segment : layout.interleaved) {
            std::size_t offset = rounds - segment.width;
            if (i >= offset) {
                stream[k].field = segment.field;
                stream[k].bit = static_cast<std::uint8_t>(i - offset);
                ++k;
            }
        }
    }
    for (const auto& segment : layout.tail) {
        for (std::size_t b = segment.width; b > 0; --b) {
            stream[k].field = segment.field;
            stream[k].bit = static_cast<std::uint8_t>(b - 1);
            ++k;
        }
    }

    Schedule schedule{};
    std::size_t next = 0;
    for (std::size_t pos = 0; pos < IDENTIFIER_BITS; ++pos) {
        bool reserved = false;
        for (const auto& r : layout.reserved) {
            if (r.position == pos) {
                schedule[pos].reserved = true;
                schedule[pos].value = r.value;
                reserved = true;
            }
        }
        if (!reserved) {
            schedule[pos] = stream[next++];
        }
    }
    return schedule;
}

namespace detail {

/// Reserved bit for bit @p index (0 = MSB) of a @p width-bit marker at @p position
constexpr ReservedBit marker_bit(std::size_t position, std::uint8_t marker, std::size_t width,
                                 std::size_t index) noexcept {
    return ReservedBit{position + index,
                       static_cast<std::uint8_t>((marker >> (width - 1 - index)) & 1U)};
}

} // namespace detail

/**
 * @brief The canonical 48-bit millisecond layout.
 */
inline constexpr Layout<3, 1, RESERVED_BITS> CANONICAL_LAYOUT{
    {{{Field::Timestamp, TIMESTAMP_BITS},
      {Field::Longitude, LONGITUDE_BITS},
      {Field::Latitude, LATITUDE_BITS}}},
    {{{Field::Random, RANDOM_BITS}}},
    {{detail::marker_bit(VERSION_POSITION, VERSION_VALUE, 4, 0),
      detail::marker_bit(VERSION_POSITION, VERSION_VALUE, 4, 1),
      detail::marker_bit(VERSION_POSITION, VERSION_VALUE, 4, 2),
      detail::marker_bit(VERSION_POSITION, VERSION_VALUE, 4, 3),
      detail::marker_bit(VARIANT_POSITION, VARIANT_VALUE, 2, 0),
      detail::marker_bit(VARIANT_POSITION, VARIANT_VALUE, 2, 1)}}};

static_assert(CANONICAL_LAYOUT.valid(), "canonical layout must fill 128 bits");

inline constexpr Schedule CANONICAL_SCHEDULE = make_schedule(CANONICAL_LAYOUT);

/**
 * @brief Pack field values into an identifier.
 *
 * Bits of a field above its width are ignored.
 *
 * @param schedule Position schedule
 * @param values Field values indexed by Field
 * @param[out] out Packed identifier
 * @return Error::Ok on success
 */
inline Error pack(const Schedule& schedule, const FieldValues& values, Identifier& out) noexcept {
    BitBuffer<IDENTIFIER_BYTES> buffer;

    for (const Slot& slot : schedule) {
        int bit = slot.reserved
                      ? static_cast<int>(slot.value)
                      : static_cast<int>((values[field_index(slot.field)] >> slot.bit) & 1U);
        auto result = buffer.append_bit(bit);
        if (result != Error::Ok) {
            return result;
        }
    }

    Identifier::Bytes bytes{};
    buffer.to_bytes(bytes.data(), bytes.size());
    out = Identifier(bytes);
    return Error::Ok;
}

/**
 * @brief Unpack field values from an identifier.
 *
 * Reserved positions are skipped, never validated. Total over all inputs.
 */
inline FieldValues unpack(const Schedule& schedule, const Identifier& id) noexcept {
    FieldValues values{};
    BitReader reader(id.data(), IDENTIFIER_BITS);

    for (const Slot& slot : schedule) {
        if (slot.reserved) {
            reader.skip(1);
            continue;
        }
        if (reader.read_bit() == 1) {
            values[field_index(slot.field)] |= std::uint64_t{1} << slot.bit;
        }
    }
    return values;
}

} // namespace geouuid

#endif // GEOUUID_LAYOUT_HPP
