/**
 * @file cli.cpp
 * @brief GeoTemporal UUID command line interface.
 *
 * Generates identifiers from a coordinate and optional time, and decodes
 * identifiers back to coordinate and time.
 */

#include <geouuid/geouuid.hpp>

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

using namespace geouuid;

static void print_version() {
    std::printf("geouuid %s (C++)\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("\nGeoTemporal UUID Generator & Decoder (v%s C++)\n", version());
    std::printf("=============================================\n\n");
    std::printf("Usage:\n");
    std::printf("  %s generate --lat <degrees> --lon <degrees> [--time <time>]\n", prog_name);
    std::printf("  %s decode <uuid>\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -h, --help     Show this help message\n");
    std::printf("  -v, --version  Show version information\n\n");
    std::printf("Generate arguments:\n");
    std::printf("  --lat          Latitude, -90 to 90\n");
    std::printf("  --lon          Longitude, -180 to 180\n");
    std::printf("  --time         Milliseconds since epoch or ISO-8601 (default: now)\n\n");
    std::printf("Decode arguments:\n");
    std::printf("  uuid           Identifier, with or without hyphens\n\n");
    std::printf("Examples:\n");
    std::printf("  %s generate --lat 40.6892 --lon -74.0445\n", prog_name);
    std::printf("  %s generate --lat 40.6892 --lon -74.0445 --time 2021-01-01T00:00:00Z\n",
                prog_name);
    std::printf("  %s decode 2896173e-7768-7c6f-bb90-7ce00155aa55\n\n", prog_name);
}

static bool parse_double(const char* text, double& value) {
    if (text == nullptr || *text == '\0') {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    double parsed = std::strtod(text, &end);
    if (errno != 0 || end == text || *end != '\0' || !std::isfinite(parsed)) {
        return false;
    }
    value = parsed;
    return true;
}

static int do_generate(int argc, char** argv) {
    const char* lat_text = nullptr;
    const char* lon_text = nullptr;
    const char* time_text = nullptr;

    for (int i = 2; i < argc; ++i) {
        const char* arg = argv[i];
        const char** target = nullptr;
        if (std::strcmp(arg, "--lat") == 0) {
            target = &lat_text;
        } else if (std::strcmp(arg, "--lon") == 0) {
            target = &lon_text;
        } else if (std::strcmp(arg, "--time") == 0) {
            target = &time_text;
        } else {
            std::fprintf(stderr, "Error: Unknown argument: %s\n", arg);
            return 1;
        }
        if (i + 1 >= argc) {
            std::fprintf(stderr, "Error: %s requires a value\n", arg);
            return 1;
        }
        *target = argv[++i];
    }

    if (lat_text == nullptr || lon_text == nullptr) {
        std::fprintf(stderr, "Error: generate requires --lat and --lon\n");
        std::fprintf(stderr, "Usage: %s generate --lat <degrees> --lon <degrees> [--time <time>]\n",
                     argv[0]);
        return 1;
    }

    double latitude = 0.0;
    double longitude = 0.0;
    if (!parse_double(lat_text, latitude)) {
        std::fprintf(stderr, "Error: Invalid latitude: %s\n", lat_text);
        return 1;
    }
    if (!parse_double(lon_text, longitude)) {
        std::fprintf(stderr, "Error: Invalid longitude: %s\n", lon_text);
        return 1;
    }

    TimeArgument time;
    if (time_text != nullptr) {
        time = std::string(time_text);
    }

    std::string output;
    Error result = generate_uuid(latitude, longitude, time, output);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: %s\n", output.c_str());
        return 1;
    }

    std::printf("%s\n", output.c_str());
    return 0;
}

static int do_decode(int argc, char** argv) {
    if (argc != 3) {
        std::fprintf(stderr, "Error: decode requires 1 argument\n");
        std::fprintf(stderr, "Usage: %s decode <uuid>\n", argv[0]);
        return 1;
    }

    Identifier id;
    Error result = Identifier::parse(argv[2], id);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error decoding: %s\n", error_string(result));
        return 1;
    }

    Decoded decoded = decode(id);
    std::printf("UUID: %s\n", id.to_string().c_str());
    std::printf("Time: %s (%lld)\n", format_iso8601(decoded.timestamp).c_str(),
                static_cast<long long>(to_millis(decoded.timestamp)));
    std::printf("Lat:  %.6f\n", decoded.latitude);
    std::printf("Lon:  %.6f\n", decoded.longitude);

    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2 || std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_help(argv[0]);
        return (argc < 2) ? 1 : 0;
    }

    if (std::strcmp(argv[1], "-v") == 0 || std::strcmp(argv[1], "--version") == 0) {
        print_version();
        return 0;
    }

    if (std::strcmp(argv[1], "generate") == 0) {
        return do_generate(argc, argv);
    }
    if (std::strcmp(argv[1], "decode") == 0) {
        return do_decode(argc, argv);
    }

    std::fprintf(stderr, "Error: Unknown command: %s\n", argv[1]);
    std::fprintf(stderr, "Run '%s --help' for usage\n", argv[0]);
    return 1;
}
