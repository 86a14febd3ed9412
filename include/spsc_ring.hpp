// ============================================================================
// spsc_ring.hpp -- Single-Producer Single-Consumer Ring Buffer
//
// Lock-free storage behind ChunkQueue: the stream reader is the only
// producer and the chunk processor the only consumer. Neither side ever
// blocks here; parking on full/empty is ChunkQueue's job.
// ============================================================================
#pragma once
#include <atomic>
#include <cstddef>
#include <new>
#include <type_traits>
#include <utility>

namespace gzrotate::spsc {

#if defined(__cpp_lib_hardware_interference_size)
constexpr std::size_t CACHE_LINE = std::hardware_destructive_interference_size;
#else
constexpr std::size_t CACHE_LINE = 64;
#endif

// Fixed-capacity SPSC ring (capacity must be a power of two).
// Slots are raw storage: an element is constructed on push and destroyed on
// pop, so T may own resources (e.g. std::vector).
template <class T, std::size_t CapacityPow2>
class Ring {
  static_assert((CapacityPow2 & (CapacityPow2 - 1)) == 0,
                "Capacity must be a power of two");
  static_assert(CapacityPow2 >= 2, "Capacity too small");

public:
  Ring() = default;
  Ring(const Ring&) = delete;
  Ring& operator=(const Ring&) = delete;

  ~Ring() {
    T tmp;
    while (pop(tmp)) {}
  }

  /// Emplace in-place into the ring.
  /// @param args The arguments to construct the object with.
  /// @return True if the object was emplaced, false if the ring is full.
  template <class... Args>
  bool emplace(Args&&... args) noexcept(
    std::is_nothrow_constructible_v<T, Args...>) {
    auto h = head_.load(std::memory_order_relaxed);
    auto next = (h + 1) & MASK;
    if (next == tail_.load(std::memory_order_acquire)) return false; // full
    ::new (static_cast<void*>(slot(h))) T(std::forward<Args>(args)...);
    head_.store(next, std::memory_order_release);
    return true;
  }

  /// Push by copy.
  bool push(const T& v) noexcept(std::is_nothrow_copy_constructible_v<T>) {
    return emplace(v);
  }

  /// Push by move. On failure `v` is left untouched.
  bool push(T&& v) noexcept(std::is_nothrow_move_constructible_v<T>) {
    return emplace(std::move(v));
  }

  /// Pop into out param.
  /// @return True if the value was popped, false if the ring is empty.
  bool pop(T& out) noexcept(std::is_nothrow_move_assignable_v<T>) {
    auto t = tail_.load(std::memory_order_relaxed);
    if (t == head_.load(std::memory_order_acquire)) return false; // empty
    T* p = std::launder(reinterpret_cast<T*>(slot(t)));
    out = std::move(*p);
    p->~T();
    tail_.store((t + 1) & MASK, std::memory_order_release);
    return true;
  }

  /// Capacity is N-1 (one slot left empty to disambiguate full vs. empty).
  static constexpr std::size_t capacity() noexcept { return CapacityPow2 - 1; }

  bool empty() const noexcept {
    return tail_.load(std::memory_order_acquire) ==
           head_.load(std::memory_order_acquire);
  }

  bool full() const noexcept {
    auto h = head_.load(std::memory_order_acquire);
    return ((h + 1) & MASK) == tail_.load(std::memory_order_acquire);
  }

  /// Approximate when called concurrently with push/pop.
  std::size_t size() const noexcept {
    auto h = head_.load(std::memory_order_acquire);
    auto t = tail_.load(std::memory_order_acquire);
    return (h - t) & MASK;
  }

private:
  static constexpr std::size_t MASK = CapacityPow2 - 1;

  std::byte* slot(std::size_t i) noexcept { return storage_ + i * sizeof(T); }

  alignas(CACHE_LINE) std::atomic<std::size_t> head_{0}; // producer writes, consumer reads
  alignas(CACHE_LINE) std::atomic<std::size_t> tail_{0}; // consumer writes, producer reads
  alignas(alignof(T) > CACHE_LINE ? alignof(T) : CACHE_LINE)
    std::byte storage_[sizeof(T) * CapacityPow2];
};

} // namespace gzrotate::spsc
