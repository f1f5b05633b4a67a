#ifndef RINGCHAN_SHARED_STATE_POLICIES_HPP
#define RINGCHAN_SHARED_STATE_POLICIES_HPP

#include <atomic>
#include <mutex>

namespace ringchan {

// =============================================================================
// Lock Policies
// =============================================================================
//
// Selects the exclusion mechanism guarding a ring buffer's slots and cursors.
// Every critical section is a single push or pop, so a spinlock is a
// reasonable choice when producers and consumers sit on dedicated cores.

struct mutex_lock_policy {
  using mutex_type = std::mutex;
  using lock_type = std::unique_lock<std::mutex>;
};

struct spinlock {
  void lock() noexcept {
    while (flag_.test_and_set(std::memory_order_acquire)) {
      while (flag_.test(std::memory_order_relaxed)) {
        // Spin with relaxed ordering for cache efficiency
      }
    }
  }

  bool try_lock() noexcept {
    return !flag_.test_and_set(std::memory_order_acquire);
  }

  void unlock() noexcept { flag_.clear(std::memory_order_release); }

private:
  std::atomic_flag flag_ = ATOMIC_FLAG_INIT;
};

struct spinlock_policy {
  using mutex_type = spinlock;
  using lock_type = std::unique_lock<spinlock>;
};

} // namespace ringchan

#endif // RINGCHAN_SHARED_STATE_POLICIES_HPP
