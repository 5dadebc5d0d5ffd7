/**
 * @file bench.cpp
 * @brief Performance benchmarks for hdrdelta compression.
 *
 * Measures compression and decompression throughput on synthetic header
 * chains, and optionally on a file of real headers.
 *
 * Usage:
 *   ./build/hdrdelta-bench                  # 100 iterations, synthetic chains
 *   ./build/hdrdelta-bench 1000             # custom iteration count
 *   ./build/hdrdelta-bench 100 headers.bin  # also benchmark a header file
 */

#include <hdrdelta/hdrdelta.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <vector>

using namespace hdrdelta;

static constexpr int DEFAULT_ITERATIONS = 100;
static constexpr std::size_t CHAIN_LENGTH = 2016;

enum class Shape {
    Steady,   ///< One version, fixed target, ~600 s spacing
    Versions, ///< Nine rotating versions, churns the cache
    Jumpy     ///< Time gaps too large for the 2-byte delta
};

static std::uint32_t next_random(std::uint32_t& state) {
    // xorshift32
    state ^= state << 13;
    state ^= state >> 17;
    state ^= state << 5;
    return state;
}

static std::vector<std::uint8_t> make_chain(Shape shape, std::size_t count) {
    std::vector<std::uint8_t> data;
    data.reserve(count * HEADER_SIZE);

    std::uint32_t rng = 0x9E3779B9U;
    Header header;
    header.version = 0x20000000U;
    header.time = 1600000000U;
    header.difficulty_target = 0x1703A30CU;

    for (std::size_t i = 0; i < count; ++i) {
        for (auto& b : header.payload_root) {
            b = static_cast<std::uint8_t>(next_random(rng));
        }
        header.nonce = next_random(rng);

        switch (shape) {
        case Shape::Steady:
            break;
        case Shape::Versions:
            header.version = 0x20000000U + static_cast<std::uint32_t>(i % 9);
            break;
        case Shape::Jumpy:
            header.time += 40000U;
            break;
        }
        if ((i % 2016) == 2015) {
            header.difficulty_target ^= 0x00010000U;
        }

        const HeaderBytes bytes = header.serialize();
        data.insert(data.end(), bytes.begin(), bytes.end());

        header.prev_digest = header.digest();
        header.time += 400U + (next_random(rng) % 400U);
    }

    return data;
}

static bool load_file(const char* path, std::vector<std::uint8_t>& data) {
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

static void bench_compress(const char* name, const std::vector<std::uint8_t>& input,
                           int iterations) {
    std::size_t num_headers = input.size() / HEADER_SIZE;
    std::vector<std::uint8_t> output(max_compressed_size(num_headers));
    std::size_t output_size = 0;

    // Warmup run
    if (compress(input.data(), input.size(), output.data(), output.size(), output_size) !=
        Error::Ok) {
        std::printf("%-20s FAIL\n", name);
        return;
    }

    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        compress(input.data(), input.size(), output.data(), output.size(), output_size);
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_iter_us = total_us / static_cast<double>(iterations);
    double per_header_us = per_iter_us / static_cast<double>(num_headers);
    double throughput_mbps = static_cast<double>(input.size()) / per_iter_us;
    double ratio = static_cast<double>(input.size() - HEADER_SIZE) /
                   static_cast<double>(output_size);

    std::printf("%-20s %8.2f us/iter  %6.3f us/hdr  %8.1f MB/s  %5.2fx  (%zu hdrs)\n",
                name, per_iter_us, per_header_us, throughput_mbps, ratio, num_headers);
}

static void bench_decompress(const char* name, const std::vector<std::uint8_t>& input,
                             int iterations) {
    std::size_t num_headers = input.size() / HEADER_SIZE;

    // First compress the data
    std::vector<std::uint8_t> compressed(max_compressed_size(num_headers));
    std::size_t compressed_size = 0;
    if (compress(input.data(), input.size(), compressed.data(), compressed.size(),
                 compressed_size) != Error::Ok) {
        std::printf("%-20s FAIL\n", name);
        return;
    }

    std::vector<std::uint8_t> output(input.size());
    std::size_t output_size = 0;

    // Warmup run
    if (decompress(input.data(), HEADER_SIZE, compressed.data(), compressed_size, output.data(),
                   output.size(), output_size) != Error::Ok) {
        std::printf("%-20s FAIL\n", name);
        return;
    }

    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        decompress(input.data(), HEADER_SIZE, compressed.data(), compressed_size, output.data(),
                   output.size(), output_size);
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_iter_us = total_us / static_cast<double>(iterations);
    double per_header_us = per_iter_us / static_cast<double>(num_headers);
    double throughput_mbps = static_cast<double>(input.size()) / per_iter_us;

    std::printf("%-20s %8.2f us/iter  %6.3f us/hdr  %8.1f MB/s  (%zu hdrs)\n",
                name, per_iter_us, per_header_us, throughput_mbps, num_headers);
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("hdrdelta Benchmarks\n");
    std::printf("===================\n");
    std::printf("Iterations: %d\n", iterations);
    std::printf("Header size: %zu bytes\n\n", HEADER_SIZE);

    std::vector<std::uint8_t> steady = make_chain(Shape::Steady, CHAIN_LENGTH);
    std::vector<std::uint8_t> versions = make_chain(Shape::Versions, CHAIN_LENGTH);
    std::vector<std::uint8_t> jumpy = make_chain(Shape::Jumpy, CHAIN_LENGTH);

    std::vector<std::uint8_t> file_data;
    bool have_file = false;
    if (argc >= 3) {
        have_file = load_file(argv[2], file_data) && !file_data.empty() &&
                    (file_data.size() % HEADER_SIZE) == 0;
    }

    std::printf("\nCompression:\n");
    bench_compress("steady", steady, iterations);
    bench_compress("versions", versions, iterations);
    bench_compress("jumpy", jumpy, iterations);
    if (have_file) {
        bench_compress(argv[2], file_data, iterations);
    } else if (argc >= 3) {
        std::printf("%-20s SKIP (not a header file)\n", argv[2]);
    }

    std::printf("\nDecompression:\n");
    bench_decompress("steady", steady, iterations);
    bench_decompress("versions", versions, iterations);
    bench_decompress("jumpy", jumpy, iterations);
    if (have_file) {
        bench_decompress(argv[2], file_data, iterations);
    }

    std::printf("\nDecompression hashes every header once to rebuild prev_digest;\n");
    std::printf("expect it to be slower than compression.\n");

    return 0;
}
