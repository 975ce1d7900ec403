/**
 * @file bench.cpp
 * @brief Performance benchmarks for JSONB decoding.
 *
 * Measures decode throughput over the test vectors for regression testing
 * during development. Use for relative comparisons only.
 *
 * Usage:
 *   ./build/jsonb_bench              # Run with default 1000 iterations
 *   ./build/jsonb_bench 10000        # Run with custom iteration count
 */

#include <jsonb/jsonb.hpp>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

using namespace jsonb;

static constexpr int DEFAULT_ITERATIONS = 1000;

static bool load_file(const std::string& path, std::vector<std::uint8_t>& data) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return false;
    }

    std::streamsize size = file.tellg();
    file.seekg(0, std::ios::beg);

    data.resize(static_cast<std::size_t>(size));
    if (!file.read(reinterpret_cast<char*>(data.data()), size)) {
        return false;
    }

    return true;
}

static void bench_decode(const char* name, const std::string& path, int iterations) {
    std::vector<std::uint8_t> input;

    if (!load_file(path, input)) {
        std::printf("%-16s SKIP (file not found)\n", name);
        return;
    }

    Decoder decoder;
    Value value;

    // Warmup run
    auto result = decoder.decode(input.data(), input.size(), value);
    if (result != Error::Ok) {
        std::printf("%-16s FAIL (%s)\n", name, error_string(result));
        return;
    }

    // Benchmark
    auto start = std::chrono::high_resolution_clock::now();

    int failures = 0;
    for (int i = 0; i < iterations; i++) {
        if (decoder.decode(input.data(), input.size(), value) != Error::Ok) {
            ++failures;
        }
    }

    auto end = std::chrono::high_resolution_clock::now();

    if (failures > 0) {
        std::printf("%-16s FAIL (%d of %d iterations)\n", name, failures, iterations);
        return;
    }

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_iter_us = total_us / static_cast<double>(iterations);
    double throughput_mbps = static_cast<double>(input.size()) / per_iter_us;
    double decodes_per_sec = 1e6 / per_iter_us;

    std::printf("%-16s %10.2f µs/iter  %9.1f MB/s  %12.0f dec/s  (%zu bytes)\n", name,
                per_iter_us, throughput_mbps, decodes_per_sec, input.size());
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("SQLite JSONB Decode Benchmarks\n");
    std::printf("==============================\n");
    std::printf("Iterations: %d\n\n", iterations);

    std::printf("%-16s %17s  %14s  %17s  %s\n", "Vector", "Time", "Throughput", "Rate", "Size");
    std::printf("%-16s %17s  %14s  %17s  %s\n", "------", "----", "----------", "----", "----");

    // Environment first, then paths relative to the build directory
    const char* env = std::getenv("TEST_VECTORS_DIR");
    std::vector<std::string> base_paths;
    if (env != nullptr && env[0] != '\0') {
        base_paths.push_back(std::string(env) + "/input/");
    }
    base_paths.push_back("test-vectors/input/");
    base_paths.push_back("../test-vectors/input/");

    std::string base_path;
    for (const auto& p : base_paths) {
        std::ifstream test(p + "nested.jsonb");
        if (test.good()) {
            base_path = p;
            break;
        }
    }

    if (base_path.empty()) {
        std::printf("Could not find test vectors directory\n");
        return 1;
    }

    const char* vectors[] = {"scalars", "nested", "json5", "unicode", "wide_array", "long_text"};
    for (const char* name : vectors) {
        bench_decode(name, base_path + name + ".jsonb", iterations);
    }

    return 0;
}
