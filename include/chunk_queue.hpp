// ============================================================================
// chunk_queue.hpp -- bounded blocking queue of byte chunks
//
// The only synchronization point between the stream reader and the chunk
// processor. Storage is a lock-free spsc::Ring; the mutex and condition
// variables are used only to park a side that cannot make progress:
//
// - push() blocks while the ring is full (backpressure on the reader),
// - pop() blocks while the ring is empty,
// - close() wakes both; pop() keeps returning queued chunks until drained.
// ============================================================================
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <vector>

#include "spsc_ring.hpp"

namespace gzrotate {

using Chunk = std::vector<uint8_t>;

class ChunkQueue {
public:
  static constexpr std::size_t SLOTS = 128;   // 127 usable

  ChunkQueue() = default;
  ChunkQueue(const ChunkQueue&) = delete;
  ChunkQueue& operator=(const ChunkQueue&) = delete;

  /// Enqueue `c`, waiting while the queue is full.
  /// @return False if the queue was closed; `c` is then left untouched.
  bool push(Chunk&& c) {
    for (;;) {
      if (closed_.load(std::memory_order_acquire)) return false;
      if (ring_.push(std::move(c))) {
        wake(not_empty_);
        return true;
      }
      std::unique_lock<std::mutex> lk(m_);
      not_full_.wait_for(lk, POLL, [&]{
        return closed_.load(std::memory_order_acquire) || !ring_.full();
      });
    }
  }

  /// Dequeue into `out`, waiting while the queue is empty.
  /// @return False once the queue is closed and fully drained.
  bool pop(Chunk& out) {
    for (;;) {
      if (ring_.pop(out)) {
        wake(not_full_);
        return true;
      }
      if (closed_.load(std::memory_order_acquire)) {
        // A push may have landed between the failed pop and the load.
        return ring_.pop(out);
      }
      std::unique_lock<std::mutex> lk(m_);
      not_empty_.wait_for(lk, POLL, [&]{
        return closed_.load(std::memory_order_acquire) || !ring_.empty();
      });
    }
  }

  /// No more pushes; wakes any waiting side.
  void close() {
    closed_.store(true, std::memory_order_release);
    std::lock_guard<std::mutex> lk(m_);
    not_full_.notify_all();
    not_empty_.notify_all();
  }

  bool closed() const noexcept {
    return closed_.load(std::memory_order_acquire);
  }

  std::size_t size() const noexcept { return ring_.size(); }
  static constexpr std::size_t capacity() noexcept { return SLOTS - 1; }

private:
  static constexpr std::chrono::milliseconds POLL{50};

  void wake(std::condition_variable& cv) {
    { std::lock_guard<std::mutex> lk(m_); }
    cv.notify_one();
  }

  spsc::Ring<Chunk, SLOTS> ring_;
  std::atomic<bool>        closed_{false};
  std::mutex               m_;
  std::condition_variable  not_full_;
  std::condition_variable  not_empty_;
};

} // namespace gzrotate
