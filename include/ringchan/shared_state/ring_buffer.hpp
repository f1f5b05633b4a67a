#ifndef RINGCHAN_SHARED_STATE_RING_BUFFER_HPP
#define RINGCHAN_SHARED_STATE_RING_BUFFER_HPP

#include <atomic>
#include <bit>
#include <cstddef>
#include <limits>
#include <memory>
#include <memory_resource>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "../allocator.hpp"
#include "concepts.hpp"
#include "policies.hpp"

namespace ringchan {

// =============================================================================
// Ring Buffer - Fixed-capacity FIFO over raw slot storage
// =============================================================================
//
// One slot is always left empty so that "empty" (head == tail) and "full"
// ((head + 1) mod capacity == tail) are distinguishable; a buffer of capacity
// N holds at most N - 1 values.
//
// Slots in [tail, head) hold live objects, every other slot is uninitialized
// memory. try_push/try_pop never block on anything but the buffer's own lock;
// suspending producers and consumers is the channel's job.

template <typename T, typename LockPolicy = mutex_lock_policy>
class ring_buffer {
  static_assert(Transferable<T>,
                "ring_buffer<T> requires a move constructible object type");
  static_assert(is_lock_policy_v<LockPolicy>,
                "ring_buffer LockPolicy must name a lockable mutex_type");

  using mutex_type = typename LockPolicy::mutex_type;
  using lock_type = typename LockPolicy::lock_type;

public:
  using value_type = T;
  using lock_policy = LockPolicy;

  explicit ring_buffer(std::size_t capacity,
                       std::pmr::memory_resource *resource = mi_resource())
      : capacity_(checked_capacity(capacity)), mask_(capacity_ - 1),
        resource_(resource),
        slots_(allocate_slots<T>(resource_, capacity_)) {}

  ~ring_buffer() {
    std::size_t current = tail_.load(std::memory_order_relaxed);
    const std::size_t head = head_.load(std::memory_order_relaxed);
    while (current != head) {
      std::destroy_at(slot(current));
      current = (current + 1) & mask_;
    }
    deallocate_slots(resource_, slots_, capacity_);
  }

  ring_buffer(const ring_buffer &) = delete;
  ring_buffer &operator=(const ring_buffer &) = delete;
  ring_buffer(ring_buffer &&) = delete;
  ring_buffer &operator=(ring_buffer &&) = delete;

  // Returns false when full; `value` is then left untouched and still owned by
  // the caller.
  template <typename U>
    requires std::constructible_from<T, U &&>
  bool try_push(U &&value) {
    lock_type lock(mutex_);
    const std::size_t head = head_.load(std::memory_order_relaxed);
    const std::size_t next = (head + 1) & mask_;
    if (next == tail_.load(std::memory_order_relaxed)) {
      return false;
    }
    std::construct_at(slot(head), std::forward<U>(value));
    head_.store(next, std::memory_order_release);
    return true;
  }

  std::optional<T> try_pop() {
    lock_type lock(mutex_);
    const std::size_t tail = tail_.load(std::memory_order_relaxed);
    if (tail == head_.load(std::memory_order_relaxed)) {
      return std::nullopt;
    }
    T *item = slot(tail);
    std::optional<T> value(std::move(*item));
    std::destroy_at(item);
    tail_.store((tail + 1) & mask_, std::memory_order_release);
    return value;
  }

  // Advisory only: the answer may be stale by the time the caller acts on it.
  bool is_empty() const noexcept {
    return head_.load(std::memory_order_acquire) ==
           tail_.load(std::memory_order_acquire);
  }

  bool is_full() const noexcept {
    return ((head_.load(std::memory_order_acquire) + 1) & mask_) ==
           tail_.load(std::memory_order_acquire);
  }

  std::size_t size() const noexcept {
    const std::size_t head = head_.load(std::memory_order_acquire);
    const std::size_t tail = tail_.load(std::memory_order_acquire);
    return (head - tail) & mask_;
  }

  std::size_t capacity() const noexcept { return capacity_; }
  std::size_t usable_capacity() const noexcept { return capacity_ - 1; }

  // Cursor positions, exposed for diagnostics and tests.
  std::size_t head() const noexcept {
    return head_.load(std::memory_order_acquire);
  }
  std::size_t tail() const noexcept {
    return tail_.load(std::memory_order_acquire);
  }

private:
  static std::size_t checked_capacity(std::size_t capacity) {
    if (!std::has_single_bit(capacity)) {
      throw std::invalid_argument("ring_buffer capacity must be a power of two, got " +
                                  std::to_string(capacity));
    }
    // The slot byte count must not wrap.
    if (capacity > std::numeric_limits<std::size_t>::max() / sizeof(T)) {
      throw std::length_error("ring_buffer capacity " + std::to_string(capacity) +
                              " exceeds the addressable slot storage");
    }
    return capacity;
  }

  T *slot(std::size_t index) const noexcept { return slots_ + index; }

  const std::size_t capacity_;
  const std::size_t mask_;
  std::pmr::memory_resource *resource_;
  T *slots_;

  std::atomic<std::size_t> head_{0}; // next write position
  std::atomic<std::size_t> tail_{0}; // next read position
  mutable mutex_type mutex_;
};

} // namespace ringchan

#endif // RINGCHAN_SHARED_STATE_RING_BUFFER_HPP
