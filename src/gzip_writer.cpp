// ============================================================================
// gzip_writer.cpp -- zlib deflate with gzip framing
// ============================================================================
#include "gzip_writer.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace gzrotate {

static constexpr std::size_t OUT_CHUNK = 64 * 1024;

GzipWriter::GzipWriter(std::unique_ptr<FileSink> sink, int level)
: sink_(std::move(sink)), out_(OUT_CHUNK) {
  // windowBits 15 + 16 selects the gzip wrapper.
  const int rc = deflateInit2(&zs_, level, Z_DEFLATED, 15 + 16, 8,
                              Z_DEFAULT_STRATEGY);
  if (rc != Z_OK) {
    throw std::runtime_error("deflateInit2 failed: " + std::to_string(rc));
  }
  open_ = true;
}

GzipWriter::~GzipWriter() { close(); }

/// Run deflate with `flush_mode` until zlib has nothing more to emit for the
/// current input, writing each filled output buffer to the sink.
bool GzipWriter::pump(int flush_mode) {
  bool ok = true;
  for (;;) {
    zs_.next_out  = out_.data();
    zs_.avail_out = static_cast<uInt>(out_.size());
    const int rc = deflate(&zs_, flush_mode);
    if (rc == Z_STREAM_ERROR) return false;

    const std::size_t have = out_.size() - zs_.avail_out;
    if (have > 0 && !sink_->write({out_.data(), have})) ok = false;

    if (flush_mode == Z_FINISH) {
      if (rc == Z_STREAM_END) break;
      continue;
    }
    // Output buffer not filled: deflate consumed all input and emitted
    // everything the flush mode requires.
    if (zs_.avail_out != 0) break;
  }
  return ok;
}

bool GzipWriter::write(std::span<const uint8_t> data) {
  if (!open_) return false;
  bool ok = true;
  // avail_in is a uInt; feed very large spans in pieces.
  while (!data.empty()) {
    const std::size_t n = std::min<std::size_t>(data.size(), 1u << 30);
    zs_.next_in  = const_cast<Bytef*>(data.data());
    zs_.avail_in = static_cast<uInt>(n);
    if (!pump(Z_NO_FLUSH)) ok = false;
    bytes_in_ += n - zs_.avail_in;
    data = data.subspan(n);
  }
  zs_.next_in  = nullptr;
  zs_.avail_in = 0;
  return ok;
}

bool GzipWriter::flush() {
  if (!open_) return false;
  bool ok = pump(Z_SYNC_FLUSH);
  return sink_->flush() && ok;
}

bool GzipWriter::close() {
  if (!open_) return true;
  bool ok = pump(Z_FINISH);
  deflateEnd(&zs_);
  open_ = false;
  return sink_->close() && ok;
}

} // namespace gzrotate
