// ============================================================================
// test_pipeline.cpp -- Test StreamReader → ChunkQueue → ChunkProcessor →
// Rotator end to end over a pipe, plus cancellation and signal handling
// ============================================================================
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

#include <zlib.h>

#include "chunk_processor.hpp"
#include "chunk_queue.hpp"
#include "rotator.hpp"
#include "shutdown.hpp"
#include "stream_reader.hpp"

#define EXPECT_TRUE(x) do{ \
  if(!(x)){ \
    std::fprintf(stderr,"EXPECT_TRUE failed: %s @ %s:%d\n",#x,__FILE__,__LINE__); \
    std::abort(); \
  } \
}while(0)

#define EXPECT_EQ(a,b) do{ \
  auto _va=(a); auto _vb=(b); \
  if(!((_va)==(_vb))){ \
    std::fprintf(stderr,"EXPECT_EQ failed: %s=%lld %s=%lld @ %s:%d\n", \
                 #a,(long long)_va,#b,(long long)_vb,__FILE__,__LINE__); \
    std::abort(); \
  } \
}while(0)

using gzrotate::CancellationToken;
using gzrotate::ChunkProcessor;
using gzrotate::ChunkQueue;
using gzrotate::ReaderConfig;
using gzrotate::Rotator;
using gzrotate::RotatorConfig;
using gzrotate::ShutdownCoordinator;
using gzrotate::StreamReader;

namespace fs = std::filesystem;
using Bytes = std::vector<uint8_t>;

// Helper to clear output dir
inline void reset_dir(const std::string& dir) {
  std::error_code ec;
  fs::remove_all(dir, ec);
  fs::create_directories(dir, ec);
}

static std::vector<std::string> list_files(const std::string& dir) {
  std::vector<std::string> out;
  for (auto& e : fs::directory_iterator(dir)) {
    if (e.is_regular_file()) out.push_back(e.path().string());
  }
  std::sort(out.begin(), out.end());
  return out;
}

static Bytes gunzip(const std::string& path) {
  Bytes out;
  gzFile gz = gzopen(path.c_str(), "rb");
  EXPECT_TRUE(gz != nullptr);
  uint8_t buf[16384];
  int n;
  while ((n = gzread(gz, buf, sizeof(buf))) > 0) out.insert(out.end(), buf, buf + n);
  EXPECT_TRUE(n == 0);
  gzclose(gz);
  return out;
}

static Bytes random_bytes(std::size_t n, uint32_t seed) {
  std::mt19937 rng(seed);
  Bytes v(n);
  for (auto& b : v) b = uint8_t(rng());
  return v;
}

/// Write all of `data` to `fd` in uneven pieces.
static void write_all(int fd, const Bytes& data) {
  std::size_t off = 0, step = 1000;
  while (off < data.size()) {
    const std::size_t n = std::min(step, data.size() - off);
    const ssize_t w = ::write(fd, data.data() + off, n);
    EXPECT_TRUE(w > 0);
    off += std::size_t(w);
    step = step % 7000 + 1777;
  }
}

static RotatorConfig make_config(const std::string& dir) {
  RotatorConfig cfg;
  cfg.file_prefix    = dir + "/stream.bin";
  cfg.time_format    = "%H%M%S.%L";
  cfg.max_file_bytes = 32 * 1024;
  cfg.max_files      = 100;
  return cfg;
}

// ============================================================================
// Test 1: everything written to the pipe ends up in the files, in order
// ============================================================================
void test_end_to_end() {
  const std::string dir = "pipe_test_e2e";
  reset_dir(dir);

  int fds[2];
  EXPECT_TRUE(::pipe(fds) == 0);

  const Bytes data = random_bytes(200 * 1024 + 123, 21);
  const std::size_t chunk = 8192;
  {
    Rotator rot(make_config(dir));
    rot.open_file();

    ChunkQueue q;
    CancellationToken token;
    ChunkProcessor proc(q, rot, chunk);
    StreamReader reader(q, ReaderConfig{fds[0], chunk, 20}, token);

    proc.start();
    reader.start();

    std::thread writer([&]{
      write_all(fds[1], data);
      ::close(fds[1]);
    });
    writer.join();
    reader.join();
    proc.join();

    EXPECT_TRUE(!proc.failed());
    EXPECT_TRUE(!reader.stats().cancelled.load());
    EXPECT_EQ(reader.stats().bytes.load(), data.size());
    EXPECT_EQ(proc.stats().bytes_written.load(), data.size());
    // Fixed-size writes plus one final partial write
    EXPECT_EQ(proc.stats().chunks_written.load(), data.size() / chunk + 1);
    EXPECT_TRUE(rot.stats().rotations.load() >= 5u);
    EXPECT_TRUE(rot.state().current == nullptr);   // finished
  }
  ::close(fds[0]);

  Bytes all;
  for (const auto& f : list_files(dir)) {
    Bytes got = gunzip(f);
    all.insert(all.end(), got.begin(), got.end());
  }
  EXPECT_TRUE(all == data);
  std::puts("test_end_to_end: OK");
}

// ============================================================================
// Test 2: cancellation stops the reader while input is still open; queued
// data is drained into the files
// ============================================================================
void test_cancellation_drains() {
  const std::string dir = "pipe_test_cancel";
  reset_dir(dir);

  int fds[2];
  EXPECT_TRUE(::pipe(fds) == 0);

  const Bytes data = random_bytes(50 * 1000, 22);
  {
    Rotator rot(make_config(dir));
    rot.open_file();

    ChunkQueue q;
    CancellationToken token;
    ChunkProcessor proc(q, rot, 4096);
    StreamReader reader(q, ReaderConfig{fds[0], 4096, 20}, token);
    proc.start();
    reader.start();

    write_all(fds[1], data);
    // Let the reader consume what was written, then cancel with the pipe open
    auto t0 = std::chrono::steady_clock::now();
    while (reader.stats().bytes.load() < data.size()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
      if (std::chrono::steady_clock::now() - t0 > std::chrono::seconds(5)) break;
    }
    token.request_stop();
    reader.join();
    proc.join();

    EXPECT_TRUE(reader.stats().cancelled.load());
    EXPECT_TRUE(q.closed());
    EXPECT_EQ(proc.stats().bytes_written.load(), data.size());
  }
  ::close(fds[1]);
  ::close(fds[0]);

  Bytes all;
  for (const auto& f : list_files(dir)) {
    Bytes got = gunzip(f);
    all.insert(all.end(), got.begin(), got.end());
  }
  EXPECT_TRUE(all == data);
  std::puts("test_cancellation_drains: OK");
}

// ============================================================================
// Test 3: a rotator that cannot create files fails the processor, which
// closes the queue and so stops the reader even though input stays open
// ============================================================================
void test_output_failure_stops_reader() {
  const std::string dir = "pipe_test_fail";
  reset_dir(dir);
  std::ofstream(dir + "/blocker") << "x";

  int fds[2];
  EXPECT_TRUE(::pipe(fds) == 0);

  RotatorConfig cfg = make_config(dir);
  cfg.file_prefix = dir + "/blocker/sub/out.bin";
  Rotator rot(cfg);   // first file is opened lazily by write_chunk

  ChunkQueue q;
  CancellationToken token;
  ChunkProcessor proc(q, rot, 1024);
  StreamReader reader(q, ReaderConfig{fds[0], 1024, 20}, token);
  proc.start();
  reader.start();

  const Bytes data = random_bytes(4096, 23);
  write_all(fds[1], data);

  proc.join();
  reader.join();
  EXPECT_TRUE(proc.failed());
  EXPECT_TRUE(q.closed());
  EXPECT_TRUE(!token.stop_requested());

  ::close(fds[1]);
  ::close(fds[0]);
  std::puts("test_output_failure_stops_reader: OK");
}

// ============================================================================
// Test 4: the first SIGTERM sets the cancellation token
// ============================================================================
void test_signal_requests_stop() {
  CancellationToken token;
  ShutdownCoordinator shutdown(token);   // blocks SIGINT/SIGTERM here
  shutdown.start();

  EXPECT_TRUE(!token.stop_requested());
  ::kill(::getpid(), SIGTERM);

  auto t0 = std::chrono::steady_clock::now();
  while (!token.stop_requested() &&
         std::chrono::steady_clock::now() - t0 < std::chrono::seconds(5)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  EXPECT_TRUE(token.stop_requested());
  EXPECT_EQ(shutdown.signals_received(), 1);
  shutdown.stop();
  std::puts("test_signal_requests_stop: OK");
}

int main() {
  std::puts("Running pipeline tests...");
  test_end_to_end();
  test_cancellation_drains();
  test_output_failure_stops_reader();
  test_signal_requests_stop();
  std::puts("All pipeline tests PASSED.");
  return 0;
}
