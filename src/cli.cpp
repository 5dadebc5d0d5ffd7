/**
 * @file cli.cpp
 * @brief hdrdelta command line interface.
 *
 * @cond INTERNAL
 * ============================================================================
 *  _          _            _        _  _
 * | |__    __| | _ __   __| |  ___ | || |_   __ _
 * | '_ \  / _` || '__| / _` | / _ \| || __| / _` |
 * | | | || (_| || |   | (_| ||  __/| || |_ | (_| |
 * |_| |_| \__,_||_|    \__,_| \___||_| \__| \__,_|
 * ============================================================================
 * @endcond
 *
 * Compresses and decompresses files of concatenated 80-byte chain headers.
 * The first header of a file is the anchor: it is not written to the
 * compressed file and must be supplied again for decompression.
 *
 * @authors hdrdelta contributors
 *
 * @see https://developer.bitcoin.org/reference/block_chain.html#block-headers Block header layout
 */

#include <hdrdelta/hdrdelta.hpp>

#include <cstdio>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>

using namespace hdrdelta;

static bool g_verbose = false;

static void print_version() {
    std::printf("hdrdelta %s\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("\nhdrdelta %s - chain header delta compression\n", version());
    std::printf("==========================================\n\n");
    std::printf("Usage:\n");
    std::printf("  %s [--verbose] <headers.bin>\n", prog_name);
    std::printf("  %s [--verbose] -d <input.hdz> <anchor.bin>\n", prog_name);
    std::printf("  %s -t <headers.bin>\n", prog_name);
    std::printf("  %s -i <headers.bin>\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -d             Decompress (default is compress)\n");
    std::printf("  -t             Round-trip check: compress, decompress, compare\n");
    std::printf("  -i             List header hashes and chain links\n");
    std::printf("  --verbose      Print one line per compressed record to stderr\n");
    std::printf("  -h, --help     Show this help message\n");
    std::printf("  -v, --version  Show version information\n\n");
    std::printf("Arguments:\n");
    std::printf("  headers.bin    Concatenated 80-byte headers, anchor first\n");
    std::printf("  input.hdz      Compressed records (anchor not included)\n");
    std::printf("  anchor.bin     File whose first 80 bytes are the anchor header\n\n");
    std::printf("Output:\n");
    std::printf("  Compress:   <headers.bin>.hdz\n");
    std::printf("  Decompress: <base>.hdr if input ends in .hdz, else <input>.hdr\n\n");
    std::printf("Examples:\n");
    std::printf("  %s headers.bin                       # compress\n", prog_name);
    std::printf("  %s -d headers.bin.hdz headers.bin    # decompress\n\n", prog_name);
}

static std::string make_decompress_filename(const std::string& input) {
    if (input.size() > 4 && input.substr(input.size() - 4) == ".hdz") {
        return input.substr(0, input.size() - 4) + ".hdr";
    }
    return input + ".hdr";
}

/**
 * @brief Read a whole file. An empty file is a successful read.
 */
static bool read_file(const std::string& path, std::vector<std::uint8_t>& data) {
    data.clear();
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return false;
    }

    std::streamsize size = file.tellg();
    if (size < 0) {
        return false;
    }
    file.seekg(0, std::ios::beg);

    data.resize(static_cast<std::size_t>(size));
    if (size > 0 && !file.read(reinterpret_cast<char*>(data.data()), size)) {
        data.clear();
        return false;
    }

    return true;
}

static bool write_file(const std::string& path, const std::uint8_t* data, std::size_t size) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    file.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    return file.good();
}

/**
 * @brief Print control byte and size of every record in a compressed run.
 */
static void dump_records(const std::uint8_t* data, std::size_t size) {
    std::size_t offset = 0;
    std::size_t index = 0;
    while (offset < size) {
        std::uint8_t control = data[offset];
        std::size_t record_size = record_size_for(control);
        std::fprintf(stderr, "record %6zu  offset %8zu  control 0x%02X  version %u  size %2zu%s\n",
                     index, offset, control,
                     static_cast<unsigned>((control & MASK_VERSION) >> VERSION_SHIFT), record_size,
                     (control & MASK_SEQUENCE_END) != 0 ? "  end" : "");
        if ((control & MASK_SEQUENCE_END) != 0) {
            break;
        }
        offset += record_size;
        ++index;
    }
}

static bool load_headers_file(const char* input_path, std::vector<std::uint8_t>& data) {
    if (!read_file(input_path, data)) {
        std::fprintf(stderr, "Error: Cannot read input file: %s\n", input_path);
        return false;
    }
    if (data.empty()) {
        std::fprintf(stderr, "Error: Input file holds no headers: %s\n", input_path);
        return false;
    }
    if ((data.size() % HEADER_SIZE) != 0) {
        std::fprintf(stderr, "Error: Input size (%zu) not divisible by header size (%zu)\n",
                     data.size(), HEADER_SIZE);
        return false;
    }
    return true;
}

static int do_compress(const char* input_path) {
    std::vector<std::uint8_t> input_data;
    if (!load_headers_file(input_path, input_data)) {
        return 1;
    }

    std::size_t input_size = input_data.size();
    std::string output_path = std::string(input_path) + ".hdz";

    std::size_t num_headers = input_size / HEADER_SIZE;
    std::vector<std::uint8_t> output_data(max_compressed_size(num_headers));
    std::size_t output_size = 0;
    std::size_t consumed = 0;

    Error result = compress(input_data.data(), input_size, output_data.data(), output_data.size(),
                            output_size, &consumed);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: Compression failed: %s\n", error_string(result));
        return 1;
    }

    if (g_verbose) {
        dump_records(output_data.data(), output_size);
    }

    if (!write_file(output_path, output_data.data(), output_size)) {
        std::fprintf(stderr, "Error: Cannot write output file: %s\n", output_path.c_str());
        return 1;
    }

    // The anchor travels out of band, so compare against headers 2..N
    std::size_t payload_size = input_size - HEADER_SIZE;
    std::printf("Input:       %s (%zu bytes, %zu headers)\n", input_path, input_size, consumed);
    std::printf("Output:      %s (%zu bytes, %zu records)\n", output_path.c_str(), output_size,
                consumed - 1);
    if (output_size > 0) {
        double ratio = static_cast<double>(payload_size) / static_cast<double>(output_size);
        std::printf("Ratio:       %.2fx (anchor excluded)\n", ratio);
    }

    return 0;
}

static int do_decompress(const char* input_path, const char* anchor_path) {
    // An anchor-only run compresses to an empty file
    std::vector<std::uint8_t> input_data;
    if (!read_file(input_path, input_data)) {
        std::fprintf(stderr, "Error: Cannot read input file: %s\n", input_path);
        return 1;
    }

    std::vector<std::uint8_t> anchor_data;
    if (!read_file(anchor_path, anchor_data)) {
        std::fprintf(stderr, "Error: Cannot read anchor file: %s\n", anchor_path);
        return 1;
    }
    if (anchor_data.size() < HEADER_SIZE) {
        std::fprintf(stderr, "Error: Anchor file must hold at least %zu bytes: %s\n", HEADER_SIZE,
                     anchor_path);
        return 1;
    }

    std::size_t input_size = input_data.size();
    std::string output_path = make_decompress_filename(input_path);

    // Every record is at least MIN_RECORD_BYTES long
    std::size_t max_headers = input_size / MIN_RECORD_BYTES;
    std::vector<std::uint8_t> output_data(max_headers * HEADER_SIZE);
    std::size_t output_size = 0;
    std::size_t consumed = 0;

    if (g_verbose) {
        dump_records(input_data.data(), input_size);
    }

    Error result = decompress(anchor_data.data(), HEADER_SIZE, input_data.data(), input_size,
                              output_data.data(), output_data.size(), output_size, &consumed);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: Decompression failed: %s\n", error_string(result));
        return 1;
    }

    if (consumed != input_size) {
        std::fprintf(stderr, "Warning: %zu trailing bytes after sequence end ignored\n",
                     input_size - consumed);
    }

    if (!write_file(output_path, output_data.data(), output_size)) {
        std::fprintf(stderr, "Error: Cannot write output file: %s\n", output_path.c_str());
        return 1;
    }

    std::printf("Input:       %s (%zu bytes)\n", input_path, consumed);
    std::printf("Output:      %s (%zu bytes, %zu headers)\n", output_path.c_str(), output_size,
                output_size / HEADER_SIZE);
    if (consumed > 0) {
        double ratio = static_cast<double>(output_size) / static_cast<double>(consumed);
        std::printf("Expansion:   %.2fx\n", ratio);
    }

    return 0;
}

static int do_roundtrip(const char* input_path) {
    std::vector<std::uint8_t> input_data;
    if (!load_headers_file(input_path, input_data)) {
        return 1;
    }

    std::size_t input_size = input_data.size();
    std::size_t num_headers = input_size / HEADER_SIZE;

    std::vector<std::uint8_t> compressed(max_compressed_size(num_headers));
    std::size_t compressed_size = 0;
    Error result = compress(input_data.data(), input_size, compressed.data(), compressed.size(),
                            compressed_size);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: Compression failed: %s\n", error_string(result));
        return 1;
    }

    std::vector<std::uint8_t> restored(input_size);
    std::size_t restored_size = 0;
    result = decompress(input_data.data(), HEADER_SIZE, compressed.data(), compressed_size,
                        restored.data(), restored.size(), restored_size);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: Decompression failed: %s\n", error_string(result));
        return 1;
    }

    // Restored output excludes the anchor
    std::size_t expected_size = input_size - HEADER_SIZE;
    if (restored_size != expected_size ||
        (expected_size > 0 &&
         std::memcmp(restored.data(), input_data.data() + HEADER_SIZE, expected_size) != 0)) {
        std::fprintf(stderr, "Error: Round trip mismatch\n");
        return 1;
    }

    std::printf("Headers:     %zu\n", num_headers);
    std::printf("Original:    %zu bytes (anchor excluded)\n", expected_size);
    std::printf("Compressed:  %zu bytes\n", compressed_size);
    if (compressed_size > 0) {
        std::printf("Ratio:       %.2fx\n",
                    static_cast<double>(expected_size) / static_cast<double>(compressed_size));
    }
    std::printf("Round trip:  OK\n");

    return 0;
}

static int do_inspect(const char* input_path) {
    std::vector<std::uint8_t> input_data;
    if (!load_headers_file(input_path, input_data)) {
        return 1;
    }

    std::size_t num_headers = input_data.size() / HEADER_SIZE;
    std::size_t broken_links = 0;
    Digest prev_digest{};

    for (std::size_t i = 0; i < num_headers; ++i) {
        Header header;
        Error result = Header::parse(&input_data[i * HEADER_SIZE], HEADER_SIZE, header);
        if (result != Error::Ok) {
            std::fprintf(stderr, "Error: Header %zu: %s\n", i, error_string(result));
            return 1;
        }

        const char* link = "anchor";
        if (i > 0) {
            bool linked = (header.prev_digest == prev_digest);
            link = linked ? "linked" : "BROKEN";
            if (!linked) {
                ++broken_links;
            }
        }

        std::printf("%8zu  %s  time %10u  %s\n", i, display_hash(header).c_str(), header.time,
                    link);
        prev_digest = header.digest();
    }

    std::printf("Headers:     %zu\n", num_headers);
    std::printf("Broken:      %zu\n", broken_links);

    return 0;
}

int main(int argc, char** argv) {
    int arg_offset = 1;

    // Check for help flag
    if (argc < 2 || std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_help(argv[0]);
        return (argc < 2) ? 1 : 0;
    }

    // Check for version flag
    if (std::strcmp(argv[1], "-v") == 0 || std::strcmp(argv[1], "--version") == 0) {
        print_version();
        return 0;
    }

    if (std::strcmp(argv[1], "--verbose") == 0) {
        g_verbose = true;
        arg_offset = 2;
    }

    int remaining = argc - arg_offset;
    if (remaining < 1) {
        std::fprintf(stderr, "Error: Missing arguments\n");
        std::fprintf(stderr, "Usage: %s [--verbose] <headers.bin>\n", argv[0]);
        return 1;
    }

    const char* mode = argv[arg_offset];

    if (std::strcmp(mode, "-d") == 0) {
        // Decompress mode: -d <input.hdz> <anchor.bin>
        if (remaining != 3) {
            std::fprintf(stderr, "Error: Decompress requires 2 arguments after -d\n");
            std::fprintf(stderr, "Usage: %s -d <input.hdz> <anchor.bin>\n", argv[0]);
            return 1;
        }
        return do_decompress(argv[arg_offset + 1], argv[arg_offset + 2]);
    }

    if (std::strcmp(mode, "-t") == 0 || std::strcmp(mode, "-i") == 0) {
        if (remaining != 2) {
            std::fprintf(stderr, "Error: %s requires 1 argument\n", mode);
            std::fprintf(stderr, "Usage: %s %s <headers.bin>\n", argv[0], mode);
            return 1;
        }
        return (mode[1] == 't') ? do_roundtrip(argv[arg_offset + 1])
                                : do_inspect(argv[arg_offset + 1]);
    }

    // Compress mode: <headers.bin>
    if (remaining != 1) {
        std::fprintf(stderr, "Error: Compress requires 1 argument\n");
        std::fprintf(stderr, "Usage: %s [--verbose] <headers.bin>\n", argv[0]);
        return 1;
    }

    return do_compress(mode);
}
