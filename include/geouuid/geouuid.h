/*
 * GeoTemporal UUID C API
 *
 * Flat C interface for embedding in non-native hosts, e.g. an Emscripten
 * build exporting these symbols to JavaScript.
 */

#ifndef GEOUUID_H
#define GEOUUID_H

#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/* Error codes (match geouuid::Error) */
#define GEOUUID_OK                    0
#define GEOUUID_ERROR_OUT_OF_RANGE    -1
#define GEOUUID_ERROR_MALFORMED_INPUT -2
#define GEOUUID_ERROR_INVALID_TIME    -3
#define GEOUUID_ERROR_INVALID_ARG     -4

/* Canonical string length, excluding the terminator */
#define GEOUUID_STRING_LENGTH 36

/**
 * Generate an identifier.
 *
 * @param lat Latitude in degrees (-90 to 90)
 * @param lon Longitude in degrees (-180 to 180)
 * @param time NULL for now, integer milliseconds or ISO-8601 text
 * @param out Receives the canonical string, or the error message on failure
 * @param out_size Size of out (GEOUUID_STRING_LENGTH + 1 holds any identifier)
 * @return GEOUUID_OK or a negative error code
 */
int geouuid_generate(double lat, double lon, const char *time, char *out, size_t out_size);

/**
 * Generate an identifier at a numeric millisecond instant.
 *
 * Fractional milliseconds are truncated toward zero.
 */
int geouuid_generate_ms(double lat, double lon, double time_ms, char *out, size_t out_size);

/**
 * Decode an identifier.
 *
 * @param uuid Grouped or ungrouped hex identifier
 * @param out Receives latitude, longitude and timestamp_ms
 * @param err Receives the error message on failure (may be NULL)
 * @param err_size Size of err
 * @return GEOUUID_OK or a negative error code
 */
int geouuid_decode(const char *uuid, double out[3], char *err, size_t err_size);

/**
 * Human-readable message for an error code.
 */
const char *geouuid_error_string(int code);

/**
 * Library version string.
 */
const char *geouuid_version(void);

#ifdef __cplusplus
}
#endif

#endif /* GEOUUID_H */
