#include "ringchan/shared_state/wait_list.hpp"

#include <algorithm>

namespace ringchan {

// =============================================================================
// wait_token
// =============================================================================

bool wait_token::notify() {
  token_state current = state_.load(std::memory_order_acquire);
  while (true) {
    switch (current) {
    case token_state::armed:
      // The registering poll is still running; it observes this in park().
      if (state_.compare_exchange_weak(current, token_state::notified,
                                       std::memory_order_acq_rel,
                                       std::memory_order_acquire)) {
        return true;
      }
      break;
    case token_state::parked:
      if (state_.compare_exchange_weak(current, token_state::notified,
                                       std::memory_order_acq_rel,
                                       std::memory_order_acquire)) {
        waker_.wake();
        return true;
      }
      break;
    case token_state::notified:
    case token_state::cancelled:
      return false;
    }
  }
}

// =============================================================================
// wait_list
// =============================================================================

std::shared_ptr<wait_token> wait_list::register_waiter(waker w) {
  auto token = std::make_shared<wait_token>(std::move(w));
  std::lock_guard<std::mutex> lock(mutex_);
  if (queue_.size() >= prune_threshold_) {
    prune_stale();
  }
  queue_.push_back(token);
  return token;
}

bool wait_list::wake_one() {
  while (true) {
    std::shared_ptr<wait_token> token;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (queue_.empty()) {
        return false;
      }
      token = std::move(queue_.front());
      queue_.pop_front();
    }
    if (token->notify()) {
      return true;
    }
  }
}

std::size_t wait_list::wake_all() {
  std::deque<std::shared_ptr<wait_token>> drained;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    drained.swap(queue_);
    prune_threshold_ = initial_prune_threshold;
  }
  std::size_t notified = 0;
  for (auto &token : drained) {
    if (token->notify()) {
      ++notified;
    }
  }
  return notified;
}

std::size_t wait_list::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<std::size_t>(
      std::count_if(queue_.begin(), queue_.end(),
                    [](const auto &token) { return !token->is_stale(); }));
}

// Called with mutex_ held. The threshold doubles with the live population so
// pruning stays amortised O(1) per registration.
void wait_list::prune_stale() {
  queue_.erase(std::remove_if(queue_.begin(), queue_.end(),
                              [](const auto &token) { return token->is_stale(); }),
               queue_.end());
  prune_threshold_ = std::max(initial_prune_threshold, queue_.size() * 2);
}

} // namespace ringchan
