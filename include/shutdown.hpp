// ============================================================================
// shutdown.hpp -- cooperative cancellation and signal handling
//
// CancellationToken is the only stop signal the pipeline sees. The reader
// checks it between bounded waits on its input; once it is set the reader
// closes the queue and the processor drains whatever is already queued.
//
// ShutdownCoordinator turns SIGINT/SIGTERM into token requests:
//   - first signal:  request_stop() and log that the pipeline is draining,
//   - second signal: log and terminate immediately with exit code 1,
//                    losing anything not yet flushed.
// Signals are blocked in every thread and consumed with sigtimedwait() on a
// dedicated thread, so no work happens in async-signal context.
// ============================================================================
#pragma once
#include <atomic>
#include <thread>

namespace gzrotate {

class CancellationToken {
public:
  void request_stop() noexcept { stop_.store(true, std::memory_order_release); }
  bool stop_requested() const noexcept {
    return stop_.load(std::memory_order_acquire);
  }

private:
  std::atomic<bool> stop_{false};
};

class ShutdownCoordinator {
public:
  /// Blocks SIGINT/SIGTERM for the calling thread and every thread it spawns
  /// afterwards. Construct on the main thread before starting the pipeline.
  explicit ShutdownCoordinator(CancellationToken& token);
  ~ShutdownCoordinator();

  ShutdownCoordinator(const ShutdownCoordinator&) = delete;
  ShutdownCoordinator& operator=(const ShutdownCoordinator&) = delete;

  void start();
  void stop();

  /// Number of termination signals received so far.
  int signals_received() const noexcept {
    return signals_.load(std::memory_order_relaxed);
  }

private:
  void loop();

  CancellationToken& token_;
  std::thread        th_;
  std::atomic<bool>  run_{false};
  std::atomic<int>   signals_{0};
};

} // namespace gzrotate
