/**
 * @file capi.cpp
 * @brief C API over the host-embedding entry points.
 *
 * No exception crosses the C boundary. A throwing clock, random source or
 * allocation surfaces as GEOUUID_ERROR_INVALID_ARG with the exception
 * message in the output buffer.
 */

#include <geouuid/geouuid.h>
#include <geouuid/geouuid.hpp>

#include <cstring>
#include <exception>
#include <string>
#include <string_view>

using namespace geouuid;

namespace {

/// Copy a message into a C buffer, truncating and always terminating
void copy_out(std::string_view text, char* out, std::size_t out_size) noexcept {
    if (out == nullptr || out_size == 0) {
        return;
    }
    std::size_t len = text.size() < out_size - 1 ? text.size() : out_size - 1;
    std::memcpy(out, text.data(), len);
    out[len] = '\0';
}

int generate_with(double lat, double lon, const TimeArgument& time, char* out,
                  std::size_t out_size) noexcept {
    if (out == nullptr || out_size == 0) {
        return static_cast<int>(Error::InvalidArg);
    }
#if !GEOUUID_NO_EXCEPTIONS
    try {
#endif
        std::string value;
        Error result = generate_uuid(lat, lon, time, value);
        if (result == Error::Ok && out_size < STRING_LENGTH + 1) {
            result = Error::InvalidArg;
            value = error_string(result);
        }
        copy_out(value, out, out_size);
        return static_cast<int>(result);
#if !GEOUUID_NO_EXCEPTIONS
    } catch (const std::exception& e) {
        copy_out(e.what(), out, out_size);
        return static_cast<int>(Error::InvalidArg);
    }
#endif
}

} // namespace

extern "C" {

int geouuid_generate(double lat, double lon, const char* time, char* out, size_t out_size) {
    if (time == nullptr) {
        return generate_with(lat, lon, TimeArgument{}, out, out_size);
    }
#if !GEOUUID_NO_EXCEPTIONS
    try {
#endif
        return generate_with(lat, lon, TimeArgument{std::string(time)}, out, out_size);
#if !GEOUUID_NO_EXCEPTIONS
    } catch (const std::exception& e) {
        copy_out(e.what(), out, out_size);
        return static_cast<int>(Error::InvalidArg);
    }
#endif
}

int geouuid_generate_ms(double lat, double lon, double time_ms, char* out, size_t out_size) {
    return generate_with(lat, lon, TimeArgument{time_ms}, out, out_size);
}

int geouuid_decode(const char* uuid, double out[3], char* err, size_t err_size) {
    Error result = Error::InvalidArg;
    if (uuid != nullptr && out != nullptr) {
        DecodedArray values{};
        result = decode_uuid(uuid, values);
        if (result == Error::Ok) {
            out[0] = values[0];
            out[1] = values[1];
            out[2] = values[2];
            return GEOUUID_OK;
        }
    }
    copy_out(error_string(result), err, err_size);
    return static_cast<int>(result);
}

const char* geouuid_error_string(int code) {
    return error_string(static_cast<Error>(code));
}

const char* geouuid_version(void) {
    return version();
}

} // extern "C"
