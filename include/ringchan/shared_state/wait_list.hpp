#ifndef RINGCHAN_SHARED_STATE_WAIT_LIST_HPP
#define RINGCHAN_SHARED_STATE_WAIT_LIST_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>

#include "waker.hpp"

namespace ringchan {

// =============================================================================
// Wait Token - One registration of a suspended operation
// =============================================================================
//
// State transitions:
//   armed    -> parked     registering poll found no work and suspends
//   armed    -> notified   wake arrived while the poll was still registering;
//                          the poll sees it in park() and retries
//   parked   -> notified   wake arrived after suspension; the waker fires
//   armed | parked -> cancelled   operation finished or was dropped
//
// Each token is notified at most once. Notified and cancelled tokens are
// stale and skipped by wake_one().

enum class token_state : std::uint8_t { armed, parked, notified, cancelled };

class wait_token {
public:
  explicit wait_token(waker w) : waker_(std::move(w)) {}

  wait_token(const wait_token &) = delete;
  wait_token &operator=(const wait_token &) = delete;

  // armed -> parked. False when a notification arrived first.
  bool park() noexcept {
    token_state expected = token_state::armed;
    return state_.compare_exchange_strong(expected, token_state::parked,
                                          std::memory_order_acq_rel,
                                          std::memory_order_acquire);
  }

  // Returns the state the token was in. A result of `notified` means a wake
  // was consumed and should be passed on.
  token_state cancel() noexcept {
    token_state current = state_.load(std::memory_order_acquire);
    while (current == token_state::armed || current == token_state::parked) {
      if (state_.compare_exchange_weak(current, token_state::cancelled,
                                       std::memory_order_acq_rel,
                                       std::memory_order_acquire)) {
        return current;
      }
    }
    return current;
  }

  // False when the token was already stale.
  bool notify();

  token_state state() const noexcept {
    return state_.load(std::memory_order_acquire);
  }

  bool is_parked() const noexcept { return state() == token_state::parked; }

  bool is_stale() const noexcept {
    const token_state s = state();
    return s == token_state::notified || s == token_state::cancelled;
  }

  const waker &target() const noexcept { return waker_; }

private:
  std::atomic<token_state> state_{token_state::armed};
  const waker waker_;
};

// =============================================================================
// Wait List - FIFO of wait tokens guarded by its own mutex
// =============================================================================

class wait_list {
public:
  wait_list() = default;

  wait_list(const wait_list &) = delete;
  wait_list &operator=(const wait_list &) = delete;

  // Appends an armed token for `w`.
  std::shared_ptr<wait_token> register_waiter(waker w);

  // Notifies the oldest live registration. Wakers run outside the lock.
  bool wake_one();

  // Notifies every live registration; returns how many were notified.
  std::size_t wake_all();

  // Live (armed or parked) registrations.
  std::size_t size() const;

  bool empty() const { return size() == 0; }

private:
  static constexpr std::size_t initial_prune_threshold = 16;

  void prune_stale();

  mutable std::mutex mutex_;
  std::deque<std::shared_ptr<wait_token>> queue_;
  std::size_t prune_threshold_{initial_prune_threshold};
};

} // namespace ringchan

#endif // RINGCHAN_SHARED_STATE_WAIT_LIST_HPP
