#ifndef RINGCHAN_SHARED_STATE_WAKER_HPP
#define RINGCHAN_SHARED_STATE_WAKER_HPP

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>

namespace ringchan {

// =============================================================================
// Waker - Handle used to resume a suspended operation
// =============================================================================
//
// Wraps the callback that resumes a suspended operation: a re-poll scheduled
// on the worker pool for coroutines, an unpark for blocked threads. Copies
// share the same callback, so will_wake() can tell whether a re-poll comes
// from the party that registered last time.

class waker {
public:
  waker() = default;

  explicit waker(std::function<void()> callback)
      : callback_(std::make_shared<std::function<void()>>(std::move(callback))) {}

  void wake() const;

  bool will_wake(const waker &other) const noexcept {
    return callback_ != nullptr && callback_ == other.callback_;
  }

  explicit operator bool() const noexcept { return callback_ != nullptr; }

private:
  std::shared_ptr<std::function<void()>> callback_;
};

// =============================================================================
// Thread Parker - Blocks an OS thread until its waker fires
// =============================================================================
//
// Lets the blocking channel API drive the same poll() state machines as the
// coroutine API. A wake that arrives before park() is remembered.

class thread_parker {
public:
  thread_parker();

  thread_parker(const thread_parker &) = delete;
  thread_parker &operator=(const thread_parker &) = delete;

  void park();
  void unpark();

  const waker &get_waker() const noexcept { return waker_; }

private:
  struct state {
    std::mutex mutex;
    std::condition_variable cv;
    bool notified{false};
  };

  std::shared_ptr<state> state_;
  waker waker_;
};

} // namespace ringchan

#endif // RINGCHAN_SHARED_STATE_WAKER_HPP
