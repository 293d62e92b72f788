/**
 * @file identifier.cpp
 * @brief Identifier text and byte conversions.
 */

#include <geouuid/identifier.hpp>

#include <cstring>

namespace geouuid {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

/// Hyphen positions in the 36-character canonical form
constexpr std::size_t GROUP_BREAKS[] = {4, 6, 8, 10};

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

} // namespace

Error Identifier::from_bytes(const std::uint8_t* data, std::size_t size,
                             Identifier& out) noexcept {
    if (data == nullptr || size != IDENTIFIER_BYTES) {
        return Error::MalformedInput;
    }
    std::memcpy(out.bytes_.data(), data, IDENTIFIER_BYTES);
    return Error::Ok;
}

Error Identifier::parse(std::string_view text, Identifier& out) noexcept {
    Bytes bytes{};
    std::size_t nibbles = 0;

    for (char c : text) {
        if (c == '-') {
            continue;
        }
        int value = hex_value(c);
        if (value < 0 || nibbles >= IDENTIFIER_BYTES * 2) {
            return Error::MalformedInput;
        }
        std::size_t byte_idx = nibbles >> 1;
        if ((nibbles & 1U) == 0) {
            bytes[byte_idx] = static_cast<std::uint8_t>(value << 4);
        } else {
            bytes[byte_idx] |= static_cast<std::uint8_t>(value);
        }
        ++nibbles;
    }

    if (nibbles != IDENTIFIER_BYTES * 2) {
        return Error::MalformedInput;
    }

    out.bytes_ = bytes;
    return Error::Ok;
}

#if !GEOUUID_NO_EXCEPTIONS
Identifier Identifier::from_string(std::string_view text) {
    Identifier id;
    auto result = parse(text, id);
    if (result != Error::Ok) {
        throw MalformedInputException("Invalid identifier '" + std::string(text) +
                                      "': " + error_string(result));
    }
    return id;
}
#endif

Error Identifier::format(char* out, std::size_t size) const noexcept {
    if (out == nullptr || size < STRING_LENGTH + 1) {
        return Error::InvalidArg;
    }

    std::size_t pos = 0;
    std::size_t next_break = 0;
    for (std::size_t i = 0; i < IDENTIFIER_BYTES; ++i) {
        if (next_break < 4 && i == GROUP_BREAKS[next_break]) {
            out[pos++] = '-';
            ++next_break;
        }
        out[pos++] = HEX_DIGITS[bytes_[i] >> 4];
        out[pos++] = HEX_DIGITS[bytes_[i] & 0x0FU];
    }
    out[pos] = '\0';

    return Error::Ok;
}

std::string Identifier::to_string() const {
    char buffer[STRING_LENGTH + 1];
    // Cannot fail: buffer is exactly large enough
    static_cast<void>(format(buffer, sizeof(buffer)));
    return std::string(buffer, STRING_LENGTH);
}

} // namespace geouuid
