/**
 * @file bench.cpp
 * @brief Performance benchmarks for GeoTemporal UUID encoding.
 *
 * Measures encode, decode and text conversion throughput for regression
 * testing during development. Use for relative comparisons only.
 *
 * Usage:
 *   ./build/geouuid_bench              # Run with default 1000000 iterations
 *   ./build/geouuid_bench 100000       # Run with custom iteration count
 */

#include <geouuid/geouuid.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <random>
#include <string>
#include <vector>

using namespace geouuid;

static constexpr int DEFAULT_ITERATIONS = 1000000;
static constexpr std::size_t SAMPLE_COUNT = 1024;

struct Sample {
    double latitude;
    double longitude;
    Timestamp timestamp;
    std::uint64_t random;
};

static std::vector<Sample> make_samples() {
    std::mt19937_64 rng(2021);
    std::uniform_real_distribution<double> lat(LATITUDE_MIN, LATITUDE_MAX);
    std::uniform_real_distribution<double> lon(LONGITUDE_MIN, LONGITUDE_MAX);

    std::vector<Sample> samples(SAMPLE_COUNT);
    for (auto& s : samples) {
        s.latitude = lat(rng);
        s.longitude = lon(rng);
        s.timestamp = from_millis(static_cast<std::int64_t>(rng() & max_code(TIMESTAMP_BITS)));
        s.random = rng();
    }
    return samples;
}

static void report(const char* name, std::chrono::high_resolution_clock::time_point start,
                   std::chrono::high_resolution_clock::time_point end, int iterations,
                   std::uint64_t checksum) {
    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_op_ns = total_us * 1000.0 / static_cast<double>(iterations);
    double mops = static_cast<double>(iterations) / total_us;

    std::printf("%-20s %8.2f ns/op  %8.2f Mops/s  (checksum %016llx)\n", name, per_op_ns, mops,
                static_cast<unsigned long long>(checksum));
}

static void bench_encode(const std::vector<Sample>& samples, int iterations) {
    Identifier id;
    std::uint64_t checksum = 0;

    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        const Sample& s = samples[static_cast<std::size_t>(i) % samples.size()];
        if (encode(s.latitude, s.longitude, s.timestamp, s.random, id) == Error::Ok) {
            checksum += id.bytes()[15];
        }
    }

    auto end = std::chrono::high_resolution_clock::now();
    report("encode", start, end, iterations, checksum);
}

static void bench_decode(const std::vector<Sample>& samples, int iterations) {
    std::vector<Identifier> ids(samples.size());
    for (std::size_t i = 0; i < samples.size(); i++) {
        const Sample& s = samples[i];
        if (encode(s.latitude, s.longitude, s.timestamp, s.random, ids[i]) != Error::Ok) {
            std::printf("%-20s SKIP (encode failed)\n", "decode");
            return;
        }
    }

    std::uint64_t checksum = 0;
    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        Decoded d = decode(ids[static_cast<std::size_t>(i) % ids.size()]);
        checksum += static_cast<std::uint64_t>(to_millis(d.timestamp));
    }

    auto end = std::chrono::high_resolution_clock::now();
    report("decode", start, end, iterations, checksum);
}

static void bench_to_string(const std::vector<Sample>& samples, int iterations) {
    Identifier id;
    const Sample& s = samples.front();
    if (encode(s.latitude, s.longitude, s.timestamp, s.random, id) != Error::Ok) {
        std::printf("%-20s SKIP (encode failed)\n", "format");
        return;
    }

    char text[STRING_LENGTH + 1];
    std::uint64_t checksum = 0;
    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        if (id.format(text, sizeof(text)) == Error::Ok) {
            checksum += static_cast<unsigned char>(text[i % STRING_LENGTH]);
        }
    }

    auto end = std::chrono::high_resolution_clock::now();
    report("format", start, end, iterations, checksum);
}

static void bench_parse(const std::vector<Sample>& samples, int iterations) {
    std::vector<std::string> texts;
    texts.reserve(samples.size());
    for (const auto& s : samples) {
        Identifier id;
        if (encode(s.latitude, s.longitude, s.timestamp, s.random, id) != Error::Ok) {
            std::printf("%-20s SKIP (encode failed)\n", "parse");
            return;
        }
        texts.push_back(id.to_string());
    }

    Identifier id;
    std::uint64_t checksum = 0;
    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        if (Identifier::parse(texts[static_cast<std::size_t>(i) % texts.size()], id) ==
            Error::Ok) {
            checksum += id.bytes()[0];
        }
    }

    auto end = std::chrono::high_resolution_clock::now();
    report("parse", start, end, iterations, checksum);
}

static void bench_generate(int iterations) {
    Generator generator;
    Identifier id;
    std::uint64_t checksum = 0;

    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        if (generator.generate(48.8584, 2.2945, id) == Error::Ok) {
            checksum += id.bytes()[15];
        }
    }

    auto end = std::chrono::high_resolution_clock::now();
    report("generate (now)", start, end, iterations, checksum);
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("GeoTemporal UUID Benchmarks\n");
    std::printf("===========================\n");
    std::printf("Iterations: %d\n", iterations);
    std::printf("Layout: %zu-bit time, %zu-bit lon, %zu-bit lat, %zu-bit random\n\n",
                TIMESTAMP_BITS, LONGITUDE_BITS, LATITUDE_BITS, RANDOM_BITS);

    std::vector<Sample> samples = make_samples();

    bench_encode(samples, iterations);
    bench_decode(samples, iterations);
    bench_to_string(samples, iterations);
    bench_parse(samples, iterations);
    bench_generate(iterations);

    std::printf("\nUse these results for relative comparisons only.\n");

    return 0;
}
