// ============================================================================
// config.hpp -- Configuration structure for gzrotate
//
// Config holds every tunable of the tool. Values come from, in increasing
// precedence: the defaults below, an optional TOML file (--config), and
// command-line flags. The result is validated once and then treated as
// immutable for the lifetime of the pipeline.
// ============================================================================
#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <stdexcept>
#include <string>

#include "rotator.hpp"

namespace gzrotate {

// ============================================================================
// Configuration structure
// ============================================================================
struct Config {
    // ========================================================================
    // Output files  ([output])
    // ========================================================================
    std::string FILE_PREFIX       { "" };      // required, e.g. "capture.pcap"
    uint64_t    FILE_SIZE_KB      { 0 };       // required, compressed KB per file
    uint32_t    NUM_FILES         { 0 };       // required, retention limit
    std::string TIME_FORMAT       { "%Y-%m-%dT%H:%M:%S.%LZ" };
    bool        LOCAL_TIME        { false };   // UTC unless set
    int         COMPRESSION_LEVEL { -1 };      // -1 default, 0 none .. 9 best
    bool        RESUME_EXISTING   { false };   // adopt matching files on disk

    // ========================================================================
    // Header replay and block boundaries  ([blocks])
    // ========================================================================
    std::size_t HEADER_BYTES      { 0 };       // 0 = disabled
    std::string BLOCK_HEADER      { "" };      // e.g. "<u32:sec><u32:usec><u32:length><u32>"
    std::size_t MAX_BLOCK_SIZE    { 262144 };  // 256 KB
    std::string ENDIANNESS        { "little" };

    // ========================================================================
    // I/O  ([io])
    // ========================================================================
    std::size_t READ_BUFFER_SIZE  { 262144 };  // read size and processing chunk size
    std::size_t IO_BUFFER_BYTES   { 1024 * 1024 };
    bool        USE_IO_URING      { false };   // needs a liburing build
    unsigned    URING_QD          { 64 };
    unsigned    MAX_INFLIGHT      { 32 };

    // ========================================================================
    // Misc  ([main])
    // ========================================================================
    bool        QUIET             { false };
    bool        PRINT_STATS       { true };

    uint64_t FILE_SIZE_BYTES() const { return FILE_SIZE_KB * 1024; }
};

/// Any invalid or unreadable configuration.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ============================================================================
// Load configuration from TOML file
// @throws ConfigError if the file cannot be read or parsed.
// ============================================================================
Config load_config(const std::string& config_path);

// ============================================================================
// Command line
// ============================================================================
struct CommandLine {
    Config cfg;
    bool   help { false };
};

/// Build a Config from argv: defaults, then --config FILE, then flags.
/// Accepts "--flag value", "--flag=value" and single-dash spellings.
/// @throws ConfigError on unknown flags or malformed values.
CommandLine parse_command_line(int argc, char** argv);

void print_usage(std::FILE* out, const char* argv0);

/// @throws ConfigError describing the first violated constraint.
void validate_config(const Config& cfg);

/// Map a validated Config onto the Rotator's configuration.
/// @throws ConfigError if BLOCK_HEADER or ENDIANNESS is malformed.
RotatorConfig make_rotator_config(const Config& cfg);

} // namespace gzrotate
