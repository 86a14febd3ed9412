// ============================================================================
// stream_reader.hpp -- input side of the pipeline
//
// The StreamReader owns one thread that reads from a file descriptor (stdin
// by default) into a reusable buffer, copies each read into a freshly
// allocated chunk and pushes it onto the ChunkQueue. A full queue blocks the
// reader, throttling input to the speed of compression and disk.
//
// The reader closes the queue when it stops, which happens on end of input,
// on a read error, or when the cancellation token is set. The token is
// checked between poll() waits of at most poll_ms.
// ============================================================================
#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>

#include "chunk_queue.hpp"
#include "shutdown.hpp"

namespace gzrotate {

// ============================================================================
// `ReaderConfig` struct
// ============================================================================
struct ReaderConfig {
  int         fd                { 0 };        // stdin
  std::size_t read_buffer_bytes { 262144 };
  int         poll_ms           { 100 };      // cancellation check interval
};

class StreamReader {
public:
  StreamReader(ChunkQueue& queue, ReaderConfig cfg, CancellationToken& token);
  ~StreamReader();

  StreamReader(const StreamReader&) = delete;
  StreamReader& operator=(const StreamReader&) = delete;

  void start();
  /// Wait for the reader thread to finish.
  void join();

  struct Stats {
    std::atomic<uint64_t> reads{0};
    std::atomic<uint64_t> bytes{0};
    std::atomic<uint64_t> read_errors{0};
    std::atomic<bool>     cancelled{false};
  };
  const Stats& stats() const noexcept;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace gzrotate
