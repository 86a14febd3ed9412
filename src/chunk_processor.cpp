// ============================================================================
// chunk_processor.cpp -- implementation of the ChunkProcessor class
// ============================================================================
#include "chunk_processor.hpp"

#include <exception>
#include <span>
#include <thread>
#include <vector>

#include "log.hpp"

namespace gzrotate {

// ============================================================================
// Impl: implementation of the ChunkProcessor class
// ============================================================================
struct ChunkProcessor::Impl {
  ChunkQueue& queue;
  Rotator&    rotator;
  std::size_t chunk_bytes;

  std::thread       th;
  std::atomic<bool> started{false};
  std::atomic<bool> failed{false};

  Stats stats;

  void write(std::span<const uint8_t> data) {
    rotator.write_chunk(data);
    stats.chunks_written.fetch_add(1, std::memory_order_relaxed);
    stats.bytes_written.fetch_add(data.size(), std::memory_order_relaxed);
  }

  void loop() {
    std::vector<uint8_t> acc;
    acc.reserve(chunk_bytes * 2);
    Chunk c;

    try {
      while (queue.pop(c)) {
        stats.chunks_in.fetch_add(1, std::memory_order_relaxed);
        acc.insert(acc.end(), c.begin(), c.end());

        std::size_t head = 0;
        while (acc.size() - head >= chunk_bytes) {
          write({acc.data() + head, chunk_bytes});
          head += chunk_bytes;
        }
        if (head > 0) acc.erase(acc.begin(), acc.begin() + static_cast<std::ptrdiff_t>(head));
      }

      if (!acc.empty()) {
        GZROT_INFO("PROC: Processing final %zu bytes of data\n", acc.size());
        write(acc);
      }
      rotator.finish();
    } catch (const std::exception& ex) {
      GZROT_ERROR("PROC: FATAL: %s\n", ex.what());
      failed.store(true, std::memory_order_release);
      queue.close();
    }
  }
};

ChunkProcessor::ChunkProcessor(ChunkQueue& queue, Rotator& rotator,
                               std::size_t chunk_bytes)
: impl_(std::unique_ptr<Impl>(new Impl{
    queue,
    rotator,
    chunk_bytes ? chunk_bytes : 1,
    {},     // th
    false,  // started
    false,  // failed
    {}      // stats
})) {}

ChunkProcessor::~ChunkProcessor() { join(); }

void ChunkProcessor::start() {
  if (impl_->started.exchange(true)) return;
  impl_->th = std::thread([this]{ impl_->loop(); });
}

void ChunkProcessor::join() {
  if (impl_->th.joinable()) impl_->th.join();
}

bool ChunkProcessor::failed() const noexcept {
  return impl_->failed.load(std::memory_order_acquire);
}

const ChunkProcessor::Stats& ChunkProcessor::stats() const noexcept {
  return impl_->stats;
}

} // namespace gzrotate
