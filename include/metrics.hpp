// ============================================================================
// metrics.hpp -- simple metrics for the Reader → Processor → Rotator pipeline
// ============================================================================
#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>

namespace gzrotate {

// ============================================================================
// `PipelineMetricsSnapshot` struct
// Snapshot of metrics at a point in time, with derived rates.
// ============================================================================
struct PipelineMetricsSnapshot {
  double        elapsed_sec{0.0};

  // raw counters
  std::uint64_t read_calls{0};
  std::uint64_t read_bytes{0};
  std::uint64_t read_errors{0};

  std::uint64_t proc_chunks_in{0};
  std::uint64_t proc_chunks_written{0};
  std::uint64_t proc_bytes{0};

  std::uint64_t rot_files_opened{0};
  std::uint64_t rot_rotations{0};
  std::uint64_t rot_forced{0};
  std::uint64_t rot_evictions{0};
  std::uint64_t rot_io_errors{0};

  // derived rates (per second)
  double read_mibps{0.0};
  double proc_mibps{0.0};
};

// ============================================================================
// `PipelineMetrics` class
// Lightweight metrics collector for the pipeline. All increments are atomic.
// ============================================================================
class PipelineMetrics {
public:
  PipelineMetrics();

  void mark_read(std::uint64_t calls, std::uint64_t bytes);
  void mark_read_error(std::uint64_t n = 1);

  void mark_proc(std::uint64_t chunks_in, std::uint64_t chunks_written,
                 std::uint64_t bytes);

  void mark_files_opened(std::uint64_t n = 1);
  void mark_rotation(std::uint64_t n = 1);
  void mark_forced_rotation(std::uint64_t n = 1);
  void mark_eviction(std::uint64_t n = 1);
  void mark_io_error(std::uint64_t n = 1);

  void reset();

  PipelineMetricsSnapshot snapshot() const;

  /// Pretty-print a snapshot (stderr by default; stdout is not ours).
  void print(std::FILE* out = stderr) const;

private:
  using clock = std::chrono::steady_clock;

  clock::time_point start_;

  std::atomic<std::uint64_t> read_calls_;
  std::atomic<std::uint64_t> read_bytes_;
  std::atomic<std::uint64_t> read_errors_;

  std::atomic<std::uint64_t> proc_chunks_in_;
  std::atomic<std::uint64_t> proc_chunks_written_;
  std::atomic<std::uint64_t> proc_bytes_;

  std::atomic<std::uint64_t> rot_files_opened_;
  std::atomic<std::uint64_t> rot_rotations_;
  std::atomic<std::uint64_t> rot_forced_;
  std::atomic<std::uint64_t> rot_evictions_;
  std::atomic<std::uint64_t> rot_io_errors_;
};

} // namespace gzrotate
