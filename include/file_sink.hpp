// ============================================================================
// file_sink.hpp -- output file backends
//
// A FileSink owns one open output file and receives already-compressed bytes.
// Two backends are provided:
//
// - StdioFileSink: buffered stdio with a configurable setvbuf() buffer.
// - UringFileSink: Linux io_uring, available when built with liburing
//   (GZROT_HAS_URING). Writes are submitted asynchronously and drained on
//   flush().
//
// size_on_disk() reports the file size as seen by fstat() after everything
// handed to write() has reached the kernel; call flush() first.
// ============================================================================
#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace gzrotate {

struct SinkConfig {
  std::size_t io_buffer_bytes = 1024 * 1024;  // stdio buffer
  bool        use_io_uring    = false;        // ignored without liburing
  unsigned    uring_qd        = 64;           // SQ/CQ depth
  unsigned    max_inflight    = 32;           // cap in-flight write requests
};

class FileSink {
public:
  virtual ~FileSink() = default;

  virtual const char* name() const noexcept = 0;

  /// Queue or write `data`. Returns false on an I/O error.
  virtual bool write(std::span<const uint8_t> data) = 0;

  /// Push everything written so far to the kernel.
  virtual bool flush() = 0;

  /// Size of the file on disk, or std::nullopt if fstat failed.
  virtual std::optional<uint64_t> size_on_disk() = 0;

  /// Flush and close. Safe to call twice.
  virtual bool close() = 0;
};

/// Create (truncate) `path` with the backend selected by `cfg`.
/// @return nullptr if the file could not be created.
std::unique_ptr<FileSink> open_file_sink(const std::string& path,
                                         const SinkConfig& cfg);

/// True if this build carries the io_uring backend.
bool uring_available() noexcept;

} // namespace gzrotate
