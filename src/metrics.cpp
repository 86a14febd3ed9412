// ============================================================================
// metrics.cpp -- implementation of PipelineMetrics
//
// read_calls_          : Number of successful read() calls by the reader.
// read_bytes_          : Bytes read from the input.
// read_errors_         : Read or poll errors that ended the input.
// proc_chunks_in_      : Chunks taken off the queue by the processor.
// proc_chunks_written_ : Fixed-size (and final partial) chunks handed to the rotator.
// proc_bytes_          : Bytes handed to the rotator.
// rot_files_opened_    : Output files created.
// rot_rotations_       : File switches (size or boundary triggered).
// rot_forced_          : Rotations forced after an exhausted boundary scan.
// rot_evictions_       : Old files deleted by the retention policy.
// rot_io_errors_       : Write/flush/stat/close errors on output files.
// ============================================================================
#include "metrics.hpp"

namespace gzrotate {

PipelineMetrics::PipelineMetrics()
  : start_(clock::now()),
    read_calls_(0),
    read_bytes_(0),
    read_errors_(0),
    proc_chunks_in_(0),
    proc_chunks_written_(0),
    proc_bytes_(0),
    rot_files_opened_(0),
    rot_rotations_(0),
    rot_forced_(0),
    rot_evictions_(0),
    rot_io_errors_(0)
{}

void PipelineMetrics::mark_read(std::uint64_t calls, std::uint64_t bytes) {
  read_calls_.fetch_add(calls, std::memory_order_relaxed);
  read_bytes_.fetch_add(bytes, std::memory_order_relaxed);
}
void PipelineMetrics::mark_read_error(std::uint64_t n) {
  read_errors_.fetch_add(n, std::memory_order_relaxed);
}

void PipelineMetrics::mark_proc(std::uint64_t chunks_in,
                                std::uint64_t chunks_written,
                                std::uint64_t bytes) {
  proc_chunks_in_.fetch_add(chunks_in, std::memory_order_relaxed);
  proc_chunks_written_.fetch_add(chunks_written, std::memory_order_relaxed);
  proc_bytes_.fetch_add(bytes, std::memory_order_relaxed);
}

void PipelineMetrics::mark_files_opened(std::uint64_t n) {
  rot_files_opened_.fetch_add(n, std::memory_order_relaxed);
}
void PipelineMetrics::mark_rotation(std::uint64_t n) {
  rot_rotations_.fetch_add(n, std::memory_order_relaxed);
}
void PipelineMetrics::mark_forced_rotation(std::uint64_t n) {
  rot_forced_.fetch_add(n, std::memory_order_relaxed);
}
void PipelineMetrics::mark_eviction(std::uint64_t n) {
  rot_evictions_.fetch_add(n, std::memory_order_relaxed);
}
void PipelineMetrics::mark_io_error(std::uint64_t n) {
  rot_io_errors_.fetch_add(n, std::memory_order_relaxed);
}

void PipelineMetrics::reset() {
  start_ = clock::now();
  read_calls_.store(0, std::memory_order_relaxed);
  read_bytes_.store(0, std::memory_order_relaxed);
  read_errors_.store(0, std::memory_order_relaxed);

  proc_chunks_in_.store(0, std::memory_order_relaxed);
  proc_chunks_written_.store(0, std::memory_order_relaxed);
  proc_bytes_.store(0, std::memory_order_relaxed);

  rot_files_opened_.store(0, std::memory_order_relaxed);
  rot_rotations_.store(0, std::memory_order_relaxed);
  rot_forced_.store(0, std::memory_order_relaxed);
  rot_evictions_.store(0, std::memory_order_relaxed);
  rot_io_errors_.store(0, std::memory_order_relaxed);
}

PipelineMetricsSnapshot PipelineMetrics::snapshot() const {
  PipelineMetricsSnapshot s{};

  s.elapsed_sec = std::chrono::duration<double>(clock::now() - start_).count();
  if (s.elapsed_sec <= 0.0) s.elapsed_sec = 1e-9; // avoid div-by-zero

  s.read_calls          = read_calls_.load(std::memory_order_relaxed);
  s.read_bytes          = read_bytes_.load(std::memory_order_relaxed);
  s.read_errors         = read_errors_.load(std::memory_order_relaxed);

  s.proc_chunks_in      = proc_chunks_in_.load(std::memory_order_relaxed);
  s.proc_chunks_written = proc_chunks_written_.load(std::memory_order_relaxed);
  s.proc_bytes          = proc_bytes_.load(std::memory_order_relaxed);

  s.rot_files_opened    = rot_files_opened_.load(std::memory_order_relaxed);
  s.rot_rotations       = rot_rotations_.load(std::memory_order_relaxed);
  s.rot_forced          = rot_forced_.load(std::memory_order_relaxed);
  s.rot_evictions       = rot_evictions_.load(std::memory_order_relaxed);
  s.rot_io_errors       = rot_io_errors_.load(std::memory_order_relaxed);

  const double dt = s.elapsed_sec;
  s.read_mibps = (s.read_bytes / dt) / (1024.0 * 1024.0);
  s.proc_mibps = (s.proc_bytes / dt) / (1024.0 * 1024.0);

  return s;
}

void PipelineMetrics::print(std::FILE* out) const {
  PipelineMetricsSnapshot s = snapshot();

  std::fprintf(out,
    "\n=== Component Stats ===\n"
    "READ:   reads=%llu  bytes=%llu  errors=%llu\n"
    "PROC:   chunks_in=%llu  chunks_written=%llu  bytes=%llu\n"
    "ROT:    files=%llu  rotations=%llu  forced=%llu  evictions=%llu  io_errors=%llu\n"
    "\n=== Throughput ===\n"
    "Elapsed: %.3f s\n"
    "READ:    %.2f MiB/s\n"
    "PROC:    %.2f MiB/s\n",
    (unsigned long long)s.read_calls,
    (unsigned long long)s.read_bytes,
    (unsigned long long)s.read_errors,
    (unsigned long long)s.proc_chunks_in,
    (unsigned long long)s.proc_chunks_written,
    (unsigned long long)s.proc_bytes,
    (unsigned long long)s.rot_files_opened,
    (unsigned long long)s.rot_rotations,
    (unsigned long long)s.rot_forced,
    (unsigned long long)s.rot_evictions,
    (unsigned long long)s.rot_io_errors,
    s.elapsed_sec,
    s.read_mibps,
    s.proc_mibps
  );
}

} // namespace gzrotate
