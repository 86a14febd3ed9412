// ============================================================================
// gzip_writer.hpp -- streaming gzip compressor over a FileSink
//
// Wraps a zlib deflate stream with a gzip wrapper. write() compresses into an
// internal output buffer and hands full buffers to the sink; flush() emits a
// Z_SYNC_FLUSH so every byte written so far can be decompressed from the
// file; close() finishes the gzip member (trailer with CRC32 and size).
// ============================================================================
#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include <zlib.h>

#include "file_sink.hpp"

namespace gzrotate {

class GzipWriter {
public:
  /// @param sink  Destination; ownership is taken.
  /// @param level zlib level, -1 (default) or 0..9.
  /// @throws std::runtime_error if deflateInit2 fails.
  GzipWriter(std::unique_ptr<FileSink> sink, int level);
  ~GzipWriter();

  GzipWriter(const GzipWriter&) = delete;
  GzipWriter& operator=(const GzipWriter&) = delete;

  bool write(std::span<const uint8_t> data);
  bool flush();
  bool close();

  FileSink& sink() noexcept { return *sink_; }

  /// Uncompressed bytes accepted so far.
  uint64_t bytes_in() const noexcept { return bytes_in_; }

private:
  bool pump(int flush_mode);

  std::unique_ptr<FileSink> sink_;
  z_stream                  zs_{};
  bool                      open_{false};
  std::vector<uint8_t>      out_;
  uint64_t                  bytes_in_{0};
};

} // namespace gzrotate
