/**
 * @file error.hpp
 * @brief GeoTemporal UUID error handling.
 *
 * Provides both exception-based and error-code-based error handling
 * for embedded compatibility (-fno-exceptions).
 */

#ifndef GEOUUID_ERROR_HPP
#define GEOUUID_ERROR_HPP

#include "config.hpp"

#if !GEOUUID_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace geouuid {

/**
 * @brief Error codes for error-code-based error handling.
 *
 * The values are shared with the C API (GEOUUID_ERROR_* macros).
 */
enum class Error {
    Ok = 0,              ///< Success
    OutOfRange = -1,     ///< Latitude or longitude outside its domain
    MalformedInput = -2, ///< Wrong length or non-hex identifier text
    InvalidTime = -3,    ///< Time argument cannot be resolved to an instant
    InvalidArg = -4      ///< Invalid argument (null pointer, short buffer)
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::OutOfRange:
        return "Latitude must be between -90 and 90 and longitude between -180 and 180";
    case Error::MalformedInput:
        return "Identifier must be 32 hex digits (hyphens allowed)";
    case Error::InvalidTime:
        return "Invalid time: expected milliseconds since epoch or ISO-8601";
    case Error::InvalidArg:
        return "Invalid argument";
    default:
        return "Unknown error";
    }
}

#if !GEOUUID_NO_EXCEPTIONS

/**
 * @brief Base exception for GeoTemporal UUID errors.
 */
class GeoUuidException : public std::runtime_error {
public:
    explicit GeoUuidException(const std::string& message, Error code = Error::InvalidArg)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for coordinates outside their closed domains.
 */
class OutOfRangeException : public GeoUuidException {
public:
    explicit OutOfRangeException(const std::string& message)
        : GeoUuidException(message, Error::OutOfRange) {}
};

/**
 * @brief Exception for identifier text or bytes that cannot be parsed.
 */
class MalformedInputException : public GeoUuidException {
public:
    explicit MalformedInputException(const std::string& message)
        : GeoUuidException(message, Error::MalformedInput) {}
};

/**
 * @brief Exception for unresolvable time arguments.
 */
class InvalidTimeException : public GeoUuidException {
public:
    explicit InvalidTimeException(const std::string& message)
        : GeoUuidException(message, Error::InvalidTime) {}
};

/**
 * @brief Throw the exception matching an error code.
 *
 * Does nothing for Error::Ok.
 */
inline void throw_if_error(Error error) {
    switch (error) {
    case Error::Ok:
        return;
    case Error::OutOfRange:
        throw OutOfRangeException(error_string(error));
    case Error::MalformedInput:
        throw MalformedInputException(error_string(error));
    case Error::InvalidTime:
        throw InvalidTimeException(error_string(error));
    default:
        throw GeoUuidException(error_string(error), error);
    }
}

#endif // !GEOUUID_NO_EXCEPTIONS

} // namespace geouuid

#endif // GEOUUID_ERROR_HPP
