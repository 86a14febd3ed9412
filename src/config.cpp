// ============================================================================
// config.cpp -- Configuration loading, command line and validation
// ============================================================================
#include "config.hpp"
#include <toml++/toml.hpp>

#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <vector>

#include "block_format.hpp"

namespace gzrotate {

// ============================================================================
// Load configuration from TOML file
// ============================================================================
Config load_config(const std::string& config_path) {
    Config cfg;

    try {
        auto tbl = toml::parse_file(config_path);

        // Output files
        if (auto v = tbl["output"]["FILE_PREFIX"].value<std::string>()) cfg.FILE_PREFIX = *v;
        if (auto v = tbl["output"]["FILE_SIZE_KB"].value<uint64_t>()) cfg.FILE_SIZE_KB = *v;
        if (auto v = tbl["output"]["NUM_FILES"].value<uint32_t>()) cfg.NUM_FILES = *v;
        if (auto v = tbl["output"]["TIME_FORMAT"].value<std::string>()) cfg.TIME_FORMAT = *v;
        if (auto v = tbl["output"]["LOCAL_TIME"].value<bool>()) cfg.LOCAL_TIME = *v;
        if (auto v = tbl["output"]["COMPRESSION_LEVEL"].value<int>()) cfg.COMPRESSION_LEVEL = *v;
        if (auto v = tbl["output"]["RESUME_EXISTING"].value<bool>()) cfg.RESUME_EXISTING = *v;

        // Header replay and block boundaries
        if (auto v = tbl["blocks"]["HEADER_BYTES"].value<std::size_t>()) cfg.HEADER_BYTES = *v;
        if (auto v = tbl["blocks"]["BLOCK_HEADER"].value<std::string>()) cfg.BLOCK_HEADER = *v;
        if (auto v = tbl["blocks"]["MAX_BLOCK_SIZE"].value<std::size_t>()) cfg.MAX_BLOCK_SIZE = *v;
        if (auto v = tbl["blocks"]["ENDIANNESS"].value<std::string>()) cfg.ENDIANNESS = *v;

        // I/O
        if (auto v = tbl["io"]["READ_BUFFER_SIZE"].value<std::size_t>()) cfg.READ_BUFFER_SIZE = *v;
        if (auto v = tbl["io"]["IO_BUFFER_BYTES"].value<std::size_t>()) cfg.IO_BUFFER_BYTES = *v;
        if (auto v = tbl["io"]["USE_IO_URING"].value<bool>()) cfg.USE_IO_URING = *v;
        if (auto v = tbl["io"]["URING_QD"].value<unsigned>()) cfg.URING_QD = *v;
        if (auto v = tbl["io"]["MAX_INFLIGHT"].value<unsigned>()) cfg.MAX_INFLIGHT = *v;

        // Misc
        if (auto v = tbl["main"]["QUIET"].value<bool>()) cfg.QUIET = *v;
        if (auto v = tbl["main"]["PRINT_STATS"].value<bool>()) cfg.PRINT_STATS = *v;
    } catch (const toml::parse_error& err) {
        throw ConfigError("error parsing config file '" + config_path + "': "
                          + std::string(err.description()));
    }

    return cfg;
}

// ============================================================================
// Command line
// ============================================================================
static long long parse_integer(const std::string& flag, const std::string& s) {
    errno = 0;
    char* end = nullptr;
    const long long v = std::strtoll(s.c_str(), &end, 10);
    if (s.empty() || errno != 0 || *end != '\0') {
        throw ConfigError("invalid value for --" + flag + ": '" + s + "'");
    }
    return v;
}

static bool parse_bool(const std::string& flag, const std::string& s) {
    if (s == "true" || s == "1")  return true;
    if (s == "false" || s == "0") return false;
    throw ConfigError("invalid boolean for --" + flag + ": '" + s + "'");
}

/// Negative values are rejected later by validate_config(); here they are
/// clamped to 0 so unsigned fields do not wrap.
static uint64_t non_negative(long long v) {
    return v < 0 ? 0 : static_cast<uint64_t>(v);
}

CommandLine parse_command_line(int argc, char** argv) {
    CommandLine cl;

    struct Arg { std::string name; std::string value; bool has_value; };
    std::vector<Arg> args;

    static const std::map<std::string, bool> known = {
        // name -> is boolean
        {"config", false},
        {"file_size", false}, {"num_files", false}, {"file_prefix", false},
        {"time_format", false}, {"local_time", true}, {"header_bytes", false},
        {"block_header", false}, {"max_block_size", false},
        {"read_buffer_size", false}, {"compression_level", false},
        {"endianness", false}, {"resume_existing", true}, {"quiet", true},
        {"use_io_uring", true}, {"stats", true},
        {"help", true}, {"h", true},
    };

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a.size() < 2 || a[0] != '-') {
            throw ConfigError("unexpected argument: " + a);
        }
        a.erase(0, a[1] == '-' ? 2 : 1);

        Arg arg{a, "", false};
        const auto eq = a.find('=');
        if (eq != std::string::npos) {
            arg.name      = a.substr(0, eq);
            arg.value     = a.substr(eq + 1);
            arg.has_value = true;
        }

        const auto it = known.find(arg.name);
        if (it == known.end()) {
            throw ConfigError("unknown flag: --" + arg.name);
        }
        if (!arg.has_value && !it->second) {
            if (i + 1 >= argc) {
                throw ConfigError("--" + arg.name + " requires a value");
            }
            arg.value     = argv[++i];
            arg.has_value = true;
        }
        args.push_back(std::move(arg));
    }

    // The config file is the base that the remaining flags override.
    for (const auto& a : args) {
        if (a.name == "config") cl.cfg = load_config(a.value);
    }

    Config& cfg = cl.cfg;
    for (const auto& a : args) {
        const std::string& n = a.name;
        const std::string& v = a.value;
        const auto flag = [&]{ return a.has_value ? parse_bool(n, v) : true; };

        if      (n == "config")            continue;
        else if (n == "help" || n == "h")  cl.help = flag();
        else if (n == "file_size")         cfg.FILE_SIZE_KB = non_negative(parse_integer(n, v));
        else if (n == "num_files") {
            const uint64_t f = non_negative(parse_integer(n, v));
            if (f > UINT32_MAX) throw ConfigError("--num_files is too large: " + v);
            cfg.NUM_FILES = static_cast<uint32_t>(f);
        }
        else if (n == "file_prefix")       cfg.FILE_PREFIX = v;
        else if (n == "time_format")       cfg.TIME_FORMAT = v;
        else if (n == "local_time")        cfg.LOCAL_TIME = flag();
        else if (n == "header_bytes") {
            const long long h = parse_integer(n, v);
            if (h < 0) throw ConfigError("--header_bytes cannot be negative");
            cfg.HEADER_BYTES = static_cast<std::size_t>(h);
        }
        else if (n == "block_header")      cfg.BLOCK_HEADER = v;
        else if (n == "max_block_size")    cfg.MAX_BLOCK_SIZE = static_cast<std::size_t>(non_negative(parse_integer(n, v)));
        else if (n == "read_buffer_size")  cfg.READ_BUFFER_SIZE = static_cast<std::size_t>(non_negative(parse_integer(n, v)));
        else if (n == "compression_level") {
            const long long l = parse_integer(n, v);
            if (l < INT_MIN || l > INT_MAX) {
                throw ConfigError("--compression_level must be between -1 and 9");
            }
            cfg.COMPRESSION_LEVEL = static_cast<int>(l);
        }
        else if (n == "endianness")        cfg.ENDIANNESS = v;
        else if (n == "resume_existing")   cfg.RESUME_EXISTING = flag();
        else if (n == "quiet")             cfg.QUIET = flag();
        else if (n == "use_io_uring")      cfg.USE_IO_URING = flag();
        else if (n == "stats")             cfg.PRINT_STATS = flag();
    }

    return cl;
}

void print_usage(std::FILE* out, const char* argv0) {
    std::fprintf(out,
      "gzrotate - Stream stdin to rotating gzip-compressed files\n\n"
      "Usage: %s [OPTIONS]\n\n"
      "Reads binary data from stdin, compresses it with gzip, and writes to a series\n"
      "of rotating files. When a file reaches the specified size, it closes and starts\n"
      "a new one. Maintains a maximum number of files by deleting the oldest.\n\n"
      "Options:\n"
      "  --config FILE             TOML file with defaults (flags override it)\n"
      "  --file_size KB            Maximum compressed size per file in KB (required)\n"
      "  --num_files N             Maximum number of files to keep (required)\n"
      "  --file_prefix PREFIX      Prefix for output files (required)\n"
      "  --time_format LAYOUT      strftime layout for filenames, %%L = milliseconds\n"
      "                            (default: %%Y-%%m-%%dT%%H:%%M:%%S.%%LZ)\n"
      "  --local_time              Use local time instead of UTC\n"
      "  --header_bytes N          Bytes from stream start replayed into every later file\n"
      "  --block_header FORMAT     Block header format for boundary detection\n"
      "  --max_block_size N        Maximum block size when scanning (default: 262144)\n"
      "  --read_buffer_size N      Read and processing chunk size (default: 262144)\n"
      "  --compression_level N     -1 (default), 0 (none), 1 (speed) .. 9 (best)\n"
      "  --endianness little|big   Byte order for multi-byte header fields\n"
      "  --resume_existing         Adopt existing files (may delete beyond --num_files)\n"
      "  --use_io_uring            Write through io_uring when available\n"
      "  --quiet                   Suppress non-error output\n"
      "  --stats=false             Do not print pipeline statistics on exit\n\n"
      "Filename Format:\n"
      "  prefix_NNNNNN_TIMESTAMP[.ext].gz  (NNNNNN is a zero-padded counter)\n\n"
      "Block Header Format:\n"
      "  Tokens <uN:type> or <sN:type>, N in {8,16,32,64}; 's' fields are signed.\n"
      "    sec     - Unix seconds, within +/-48 hours of now\n"
      "    usec    - Microseconds (0-999999)\n"
      "    nsec    - Nanoseconds (0-999999999)\n"
      "    length  - Payload length in bytes (0..max_block_size), at most one\n"
      "    0xHEX   - Magic number (exact match)\n"
      "    (none)  - Any value\n"
      "  Example for pcap: <u32:sec><u32:usec><u32:length><u32>\n\n"
      "Examples:\n"
      "  cat data.bin | %s --file_size 10240 --num_files 5 --file_prefix output\n"
      "  tcpdump -w - | %s --file_size 102400 --num_files 10 --file_prefix capture.pcap \\\n"
      "      --header_bytes 24 --block_header '<u32:sec><u32:usec><u32:length><u32>'\n",
      argv0, argv0, argv0);
}

// ============================================================================
// Validation
// ============================================================================
void validate_config(const Config& cfg) {
    if (cfg.FILE_SIZE_KB == 0) {
        throw ConfigError("--file_size is required and must be positive");
    }
    if (cfg.FILE_SIZE_KB > UINT64_MAX / 1024) {
        throw ConfigError("--file_size is too large");
    }
    if (cfg.NUM_FILES == 0) {
        throw ConfigError("--num_files is required and must be positive");
    }
    if (cfg.FILE_PREFIX.empty()) {
        throw ConfigError("--file_prefix is required");
    }
    if (cfg.TIME_FORMAT.empty()) {
        throw ConfigError("--time_format cannot be empty");
    }
    if (cfg.MAX_BLOCK_SIZE == 0) {
        throw ConfigError("--max_block_size must be positive");
    }
    if (cfg.READ_BUFFER_SIZE == 0) {
        throw ConfigError("--read_buffer_size must be positive");
    }
    if (cfg.COMPRESSION_LEVEL < -1 || cfg.COMPRESSION_LEVEL > 9) {
        throw ConfigError("--compression_level must be between -1 and 9");
    }
    if (cfg.HEADER_BYTES > cfg.READ_BUFFER_SIZE) {
        throw ConfigError("--read_buffer_size must be at least as large as --header_bytes");
    }
    if (cfg.MAX_BLOCK_SIZE > cfg.READ_BUFFER_SIZE) {
        throw ConfigError("--read_buffer_size must be at least as large as --max_block_size");
    }
    try {
        parse_byte_order(cfg.ENDIANNESS);
        if (!cfg.BLOCK_HEADER.empty()) {
            parse_block_format(cfg.BLOCK_HEADER, ByteOrder::Little);
        }
    } catch (const FormatError& err) {
        throw ConfigError(err.what());
    }
}

RotatorConfig make_rotator_config(const Config& cfg) {
    RotatorConfig rc;
    rc.file_prefix       = cfg.FILE_PREFIX;
    rc.max_file_bytes    = cfg.FILE_SIZE_BYTES();
    rc.max_files         = cfg.NUM_FILES;
    rc.time_format       = cfg.TIME_FORMAT;
    rc.local_time        = cfg.LOCAL_TIME;
    rc.header_bytes      = cfg.HEADER_BYTES;
    rc.max_block_bytes   = cfg.MAX_BLOCK_SIZE;
    rc.compression_level = cfg.COMPRESSION_LEVEL;

    rc.sink.io_buffer_bytes = cfg.IO_BUFFER_BYTES;
    rc.sink.use_io_uring    = cfg.USE_IO_URING;
    rc.sink.uring_qd        = cfg.URING_QD;
    rc.sink.max_inflight    = cfg.MAX_INFLIGHT;

    try {
        if (!cfg.BLOCK_HEADER.empty()) {
            rc.block_format = parse_block_format(cfg.BLOCK_HEADER,
                                                 parse_byte_order(cfg.ENDIANNESS));
        }
    } catch (const FormatError& err) {
        throw ConfigError(err.what());
    }
    return rc;
}

} // namespace gzrotate
