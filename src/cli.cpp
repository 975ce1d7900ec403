/**
 * @file cli.cpp
 * @brief JSONB command line interface.
 *
 * Reads a file holding a SQLite JSONB blob and prints it as JSON text.
 *
 * @authors jsonb contributors
 *
 * @see https://sqlite.org/jsonb.html SQLite JSONB format
 */

#include <jsonb/jsonb.hpp>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>

using namespace jsonb;

struct CliOptions {
    const char* input_path = nullptr;
    DecodeOptions decode;
    WriteOptions write;
    bool all = false;
};

static void print_version() {
    std::printf("jsonb %s\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("SQLite JSONB decoder (v%s)\n", version());
    std::printf("==========================\n\n");
    std::printf("Reference:\n");
    std::printf("  SQLite JSONB: https://sqlite.org/jsonb.html\n\n");
    std::printf("Usage:\n");
    std::printf("  %s [options] <input>\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -s, --strict       Reject bytes after the value\n");
    std::printf("  -a, --all          Decode concatenated values, one per line\n");
    std::printf("  -i, --indent N     Indent output by N spaces (0-16, default 0)\n");
    std::printf("  -d, --max-depth N  Maximum nesting depth (default %zu)\n", MAX_DEPTH);
    std::printf("  -h, --help         Show this help message\n");
    std::printf("  -v, --version      Show version information\n\n");
    std::printf("Examples:\n");
    std::printf("  %s blob.jsonb\n", prog_name);
    std::printf("  %s -i 2 blob.jsonb\n\n", prog_name);
}

static bool is_flag(const char* arg, const char* short_name, const char* long_name) {
    return std::strcmp(arg, short_name) == 0 || std::strcmp(arg, long_name) == 0;
}

static bool parse_count(const char* text, long min, long max, long& value) {
    char* end = nullptr;
    long parsed = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || parsed < min || parsed > max) {
        return false;
    }
    value = parsed;
    return true;
}

static bool read_file(const std::string& path, std::vector<std::uint8_t>& buffer) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return false;
    }

    std::streamsize size = file.tellg();
    if (size < 0) {
        return false;
    }
    file.seekg(0, std::ios::beg);

    buffer.resize(static_cast<std::size_t>(size));
    return static_cast<bool>(file.read(reinterpret_cast<char*>(buffer.data()), size));
}

static int report_decode_error(const Decoder& decoder, Error result) {
    std::fprintf(stderr, "Error: %s (code %d) at offset %zu\n", error_string(result),
                 static_cast<int>(result), decoder.error_offset());
    return 1;
}

static int run(const CliOptions& options) {
    std::vector<std::uint8_t> input;
    if (!read_file(options.input_path, input)) {
        std::fprintf(stderr, "Error: Cannot read input file: %s\n", options.input_path);
        return 1;
    }
    if (input.empty()) {
        std::fprintf(stderr, "Error: Input file is empty: %s\n", options.input_path);
        return 1;
    }

    Decoder decoder(options.decode);

    // Render everything before printing so a failure leaves stdout empty
    std::string output;
    if (options.all) {
        std::vector<Value> values;
        auto result = decoder.decode_sequence(input.data(), input.size(), values);
        if (result != Error::Ok) {
            return report_decode_error(decoder, result);
        }
        for (const auto& value : values) {
            output += to_json(value, options.write);
            output.push_back('\n');
        }
    } else {
        Value value;
        auto result = decoder.decode(input.data(), input.size(), value);
        if (result != Error::Ok) {
            return report_decode_error(decoder, result);
        }
        output = to_json(value, options.write);
        output.push_back('\n');
    }

    std::fwrite(output.data(), 1, output.size(), stdout);
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_help(argv[0]);
        return 1;
    }

    CliOptions options;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (is_flag(arg, "-h", "--help")) {
            print_help(argv[0]);
            return 0;
        }
        if (is_flag(arg, "-v", "--version")) {
            print_version();
            return 0;
        }

        if (is_flag(arg, "-s", "--strict")) {
            options.decode.strict = true;
        } else if (is_flag(arg, "-a", "--all")) {
            options.all = true;
        } else if (is_flag(arg, "-i", "--indent")) {
            long indent = 0;
            if (i + 1 >= argc || !parse_count(argv[i + 1], 0, 16, indent)) {
                std::fprintf(stderr, "Error: --indent requires a value 0-16\n");
                return 1;
            }
            options.write.indent = static_cast<int>(indent);
            ++i;
        } else if (is_flag(arg, "-d", "--max-depth")) {
            long depth = 0;
            if (i + 1 >= argc || !parse_count(argv[i + 1], 1, 10000, depth)) {
                std::fprintf(stderr, "Error: --max-depth requires a value 1-10000\n");
                return 1;
            }
            options.decode.max_depth = static_cast<std::size_t>(depth);
            ++i;
        } else if (arg[0] == '-' && arg[1] != '\0') {
            std::fprintf(stderr, "Error: Unknown option: %s\n", arg);
            std::fprintf(stderr, "Usage: %s [options] <input>\n", argv[0]);
            return 1;
        } else if (options.input_path == nullptr) {
            options.input_path = arg;
        } else {
            std::fprintf(stderr, "Error: Only one input file may be given\n");
            return 1;
        }
    }

    if (options.input_path == nullptr) {
        std::fprintf(stderr, "Error: No input file given\n");
        std::fprintf(stderr, "Usage: %s [options] <input>\n", argv[0]);
        return 1;
    }

    return run(options);
}
