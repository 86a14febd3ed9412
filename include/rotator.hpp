// ============================================================================
// rotator.hpp -- rotating gzip output files
//
// The Rotator persists a byte stream as a sequence of gzip files named
//
//     {prefix_base}_{counter:06d}_{timestamp}{ext}.gz
//
// where prefix_base/ext come from splitting the configured prefix at its
// final extension ("capture.pcap" -> "capture", ".pcap").
//
// Core behavior:
//
// - Size-bounded files: before each chunk the compressor is sync-flushed and
//   the file size on disk is compared against max_file_bytes, so the bound is
//   on compressed output, not on input volume.
// - Retention: at most max_files files are kept; the oldest is deleted when a
//   new file would exceed the limit.
// - Header replay: the first header_bytes of the stream are captured once and
//   written at the start of every file after the first.
// - Boundary-aware cuts: with a BlockFormat configured, a full file is not
//   cut immediately. Incoming bytes are held back until a validated block
//   header with a fully buffered payload is found; the old file receives
//   everything up to the end of that block. If no complete block shows up
//   within max_block_bytes + header size, the cut is forced.
// - Resume: optionally adopt matching files already on disk.
//
// Threading: not thread-safe. Exactly one thread (the chunk processor) may
// call into a Rotator; all rotation state lives in the RotationState it owns.
// ============================================================================
#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "block_format.hpp"
#include "file_sink.hpp"
#include "gzip_writer.hpp"

namespace gzrotate {

// ============================================================================
// RotatorConfig: configuration for the Rotator class
// ============================================================================
struct RotatorConfig {
  std::string file_prefix       = "output";
  uint64_t    max_file_bytes    = 1024 * 1024;
  std::size_t max_files         = 10;
  std::string time_format       = "%Y-%m-%dT%H:%M:%S.%LZ";
  bool        local_time        = false;
  std::size_t header_bytes      = 0;           // 0 = no header replay
  std::optional<BlockFormat> block_format;     // unset = cut anywhere
  std::size_t max_block_bytes   = 262144;
  int         compression_level = -1;          // zlib: -1 or 0..9
  SinkConfig  sink;
};

// ============================================================================
// RotationState: every piece of mutable rotation state, owned by the Rotator
// ============================================================================
struct RotationState {
  uint64_t                    file_counter{0};   // next counter to use
  std::deque<std::string>     active_files;      // oldest first
  std::string                 current_path;
  std::unique_ptr<GzipWriter> current;           // null when no file is open

  std::vector<uint8_t>        header;
  bool                        header_captured{false};

  // Boundary search in progress when `rotating` is set.
  bool                        rotating{false};
  std::vector<uint8_t>        pending;
  std::size_t                 scan_from{0};
};

class Rotator {
public:
  explicit Rotator(RotatorConfig cfg);
  ~Rotator();

  Rotator(const Rotator&) = delete;
  Rotator& operator=(const Rotator&) = delete;

  /// Adopt matching files from the output directory: sort by counter, delete
  /// the oldest beyond max_files, and continue from the highest counter + 1.
  /// Call before the first open_file().
  void resume_existing();

  /// Open the next output file, evicting the oldest one if needed.
  /// @throws std::runtime_error if the file cannot be created.
  void open_file();

  /// Finish the gzip stream and close the current file. No-op if none open.
  void close_file();

  /// Write one chunk of the stream, rotating as needed.
  /// I/O errors are logged and counted, never thrown; only a failure to
  /// create the next file throws.
  void write_chunk(std::span<const uint8_t> data);

  /// Write out anything held back by an unfinished boundary search, then
  /// close the current file.
  void finish();

  const RotationState& state() const noexcept { return state_; }
  const RotatorConfig& config() const noexcept { return cfg_; }

  struct Stats {
    std::atomic<uint64_t> bytes_in{0};
    std::atomic<uint64_t> files_opened{0};
    std::atomic<uint64_t> rotations{0};
    std::atomic<uint64_t> forced_rotations{0};
    std::atomic<uint64_t> evictions{0};
    std::atomic<uint64_t> io_errors{0};
  };
  const Stats& stats() const noexcept { return stats_; }

private:
  void capture_header(std::span<const uint8_t> data);
  bool size_limit_reached();
  void write_current(std::span<const uint8_t> data);
  void scan_pending();
  void cut_pending_at(std::size_t end, bool forced);
  void rotate();
  std::string next_filename() const;

  RotatorConfig cfg_;
  RotationState state_;
  Stats         stats_;
};

/// Render `tp` with a strftime layout; `%L` expands to milliseconds (000-999).
std::string format_timestamp(const std::string& layout,
                             std::chrono::system_clock::time_point tp,
                             bool local_time);

/// Split a prefix at its final extension: "a/b.pcap" -> {"a/b", ".pcap"}.
std::pair<std::string, std::string> split_prefix(const std::string& prefix);

} // namespace gzrotate
