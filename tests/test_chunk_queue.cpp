// ============================================================================
// test_chunk_queue.cpp -- Test the bounded blocking chunk queue
// ============================================================================
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <thread>

#include "chunk_queue.hpp"

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

using gzrotate::Chunk;
using gzrotate::ChunkQueue;

// ============================================================================
// Test 1: close lets the consumer drain what is queued, then reports done
// ============================================================================
void test_close_then_drain() {
  ChunkQueue q;
  EXPECT_EQ(q.capacity(), 127u);
  EXPECT_TRUE(q.push(Chunk{1, 2, 3}));
  EXPECT_TRUE(q.push(Chunk{4}));
  q.close();
  EXPECT_TRUE(q.closed());

  Chunk extra{9};
  EXPECT_TRUE(!q.push(std::move(extra)));
  EXPECT_EQ(extra.size(), 1u);

  Chunk c;
  EXPECT_TRUE(q.pop(c)); EXPECT_EQ(c.size(), 3u);
  EXPECT_TRUE(q.pop(c)); EXPECT_EQ(c.size(), 1u); EXPECT_EQ(c[0], 4);
  EXPECT_TRUE(!q.pop(c));
  std::puts("test_close_then_drain: OK");
}

// ============================================================================
// Test 2: a full queue blocks the producer until the consumer makes room
// ============================================================================
void test_backpressure() {
  ChunkQueue q;
  for (std::size_t i = 0; i < q.capacity(); ++i) {
    EXPECT_TRUE(q.push(Chunk(8, uint8_t(i))));
  }

  std::atomic<bool> pushed{false};
  std::thread prod([&]{
    EXPECT_TRUE(q.push(Chunk(8, 0xAB)));
    pushed = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  EXPECT_TRUE(!pushed.load());

  Chunk c;
  EXPECT_TRUE(q.pop(c));
  EXPECT_EQ(c[0], 0);
  prod.join();
  EXPECT_TRUE(pushed.load());
  EXPECT_EQ(q.size(), q.capacity());
  std::puts("test_backpressure: OK");
}

// ============================================================================
// Test 3: close wakes a blocked producer and a blocked consumer
// ============================================================================
void test_close_wakes_waiters() {
  {
    ChunkQueue q;
    for (std::size_t i = 0; i < q.capacity(); ++i) EXPECT_TRUE(q.push(Chunk{1}));
    std::atomic<int> result{-1};
    std::thread prod([&]{ result = q.push(Chunk{2}) ? 1 : 0; });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    q.close();
    prod.join();
    EXPECT_EQ(result.load(), 0);
  }
  {
    ChunkQueue q;
    std::atomic<int> result{-1};
    std::thread cons([&]{ Chunk c; result = q.pop(c) ? 1 : 0; });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    q.close();
    cons.join();
    EXPECT_EQ(result.load(), 0);
  }
  std::puts("test_close_wakes_waiters: OK");
}

// ============================================================================
// Test 4: producer and consumer threads, every byte arrives in order
// ============================================================================
void test_threads_in_order() {
  ChunkQueue q;
  constexpr uint32_t N = 20'000;
  std::atomic<uint64_t> sum{0};
  std::atomic<bool> ordered{true};

  std::thread cons([&]{
    Chunk c;
    uint32_t expect = 0;
    uint64_t s = 0;
    while (q.pop(c)) {
      if (c.size() != 4) ordered = false;
      uint32_t v = uint32_t(c[0]) | uint32_t(c[1]) << 8 |
                   uint32_t(c[2]) << 16 | uint32_t(c[3]) << 24;
      if (v != expect++) ordered = false;
      s += v;
    }
    sum = s;
  });

  for (uint32_t i = 0; i < N; ++i) {
    Chunk c{uint8_t(i), uint8_t(i >> 8), uint8_t(i >> 16), uint8_t(i >> 24)};
    EXPECT_TRUE(q.push(std::move(c)));
  }
  q.close();
  cons.join();

  EXPECT_TRUE(ordered.load());
  EXPECT_EQ(sum.load(), uint64_t(N) * (N - 1) / 2);
  std::puts("test_threads_in_order: OK");
}

int main() {
  std::puts("Running chunk queue tests...");
  test_close_then_drain();
  test_backpressure();
  test_close_wakes_waiters();
  test_threads_in_order();
  std::puts("All chunk queue tests PASSED.");
  return 0;
}
