// ============================================================================
// chunk_processor.hpp -- output side of the pipeline
//
// The ChunkProcessor owns one thread that drains the ChunkQueue, re-slices
// the incoming reads into fixed-size chunks of `chunk_bytes`, and feeds each
// one to the Rotator. Reads rarely line up with the chunk size, so bytes are
// accumulated until a full chunk is available. When the queue is closed and
// empty, the remaining partial chunk is written once and the Rotator is
// finished (held-back bytes written, current file closed).
//
// This thread is the only caller of the Rotator.
// ============================================================================
#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>

#include "chunk_queue.hpp"
#include "rotator.hpp"

namespace gzrotate {

class ChunkProcessor {
public:
  /// @param queue       Source of chunks.
  /// @param rotator     Sink; must outlive the processor.
  /// @param chunk_bytes Size of every write except the last.
  ChunkProcessor(ChunkQueue& queue, Rotator& rotator, std::size_t chunk_bytes);
  ~ChunkProcessor();

  ChunkProcessor(const ChunkProcessor&) = delete;
  ChunkProcessor& operator=(const ChunkProcessor&) = delete;

  void start();
  /// Wait for the queue to drain and the Rotator to finish.
  void join();

  /// True if the Rotator threw (could not create a file). The queue is
  /// closed in that case so the reader stops too.
  bool failed() const noexcept;

  struct Stats {
    std::atomic<uint64_t> chunks_in{0};
    std::atomic<uint64_t> chunks_written{0};
    std::atomic<uint64_t> bytes_written{0};
  };
  const Stats& stats() const noexcept;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace gzrotate
