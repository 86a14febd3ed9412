// ============================================================================
// stream_reader.cpp -- implementation of the StreamReader class
// ============================================================================
#include "stream_reader.hpp"

#include <cerrno>
#include <cstring>
#include <thread>
#include <vector>
#include <poll.h>
#include <unistd.h>

#include "log.hpp"

namespace gzrotate {

// ============================================================================
// Impl: implementation of the StreamReader class
// ============================================================================
struct StreamReader::Impl {
  ChunkQueue&        queue;
  ReaderConfig       cfg;
  CancellationToken& token;

  /// Thread for the reader loop
  std::thread th;
  std::atomic<bool> started{false};

  Stats stats;

  /// Wait until the descriptor is readable, the token is set, or the
  /// consumer closed the queue.
  /// @return True if a read should be attempted.
  bool wait_readable() {
    pollfd pfd{cfg.fd, POLLIN, 0};
    while (!token.stop_requested()) {
      if (queue.closed()) return false;
      const int r = ::poll(&pfd, 1, cfg.poll_ms);
      if (r > 0) return true;   // POLLIN, POLLHUP or POLLERR: read() tells
      if (r < 0 && errno != EINTR) {
        GZROT_ERROR("READ: poll failed: %s\n", std::strerror(errno));
        stats.read_errors.fetch_add(1, std::memory_order_relaxed);
        return false;
      }
    }
    stats.cancelled.store(true, std::memory_order_relaxed);
    GZROT_INFO("READ: Stop requested, closing input\n");
    return false;
  }

  /// Main loop: read, copy into a new chunk, enqueue. Never hands out the
  /// reusable read buffer itself.
  void loop() {
    std::vector<uint8_t> buf(cfg.read_buffer_bytes);

    while (wait_readable()) {
      const ssize_t n = ::read(cfg.fd, buf.data(), buf.size());
      if (n > 0) {
        stats.reads.fetch_add(1, std::memory_order_relaxed);
        stats.bytes.fetch_add(static_cast<uint64_t>(n), std::memory_order_relaxed);
        Chunk chunk(buf.begin(), buf.begin() + n);
        if (!queue.push(std::move(chunk))) {
          GZROT_INFO("READ: Queue closed, stopping reader\n");
          break;
        }
        continue;
      }
      if (n == 0) break;   // EOF
      if (errno == EINTR || errno == EAGAIN) continue;
      GZROT_ERROR("READ: error reading input: %s\n", std::strerror(errno));
      stats.read_errors.fetch_add(1, std::memory_order_relaxed);
      break;
    }
    queue.close();
  }
};

StreamReader::StreamReader(ChunkQueue& queue, ReaderConfig cfg,
                           CancellationToken& token)
: impl_(std::unique_ptr<Impl>(new Impl{
    queue,
    std::move(cfg),
    token,
    {},     // th
    false,  // started
    {}      // stats
})) {}

StreamReader::~StreamReader() { join(); }

void StreamReader::start() {
  if (impl_->started.exchange(true)) return;
  impl_->th = std::thread([this]{ impl_->loop(); });
}

void StreamReader::join() {
  if (impl_->th.joinable()) impl_->th.join();
}

const StreamReader::Stats& StreamReader::stats() const noexcept {
  return impl_->stats;
}

} // namespace gzrotate
