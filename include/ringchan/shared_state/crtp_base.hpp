#ifndef RINGCHAN_SHARED_STATE_CRTP_BASE_HPP
#define RINGCHAN_SHARED_STATE_CRTP_BASE_HPP

#include <coroutine>
#include <functional>

namespace ringchan {

// Implemented by the runtime (task_scheduler.cpp).
void schedule_coro_handle(std::coroutine_handle<> handle);
void schedule_task_on_pool(std::function<void()> task);

// =============================================================================
// Poll Status - Outcome of one step of a resumable operation
// =============================================================================

enum class poll_status { pending, ready };

// =============================================================================
// Awaitable Base - Provides standard coroutine awaiter interface via CRTP
// =============================================================================

template <typename Derived, typename T> class awaitable_base {
protected:
  // Derived class must implement:
  // - bool ready_impl()
  // - bool suspend_impl(std::coroutine_handle<> h)   (false = resume now)
  // - T resume_impl()

  Derived &derived() { return static_cast<Derived &>(*this); }
  const Derived &derived() const { return static_cast<const Derived &>(*this); }

public:
  bool await_ready() { return derived().ready_impl(); }

  bool await_suspend(std::coroutine_handle<> h) {
    return derived().suspend_impl(h);
  }

  T await_resume() { return derived().resume_impl(); }
};

} // namespace ringchan

#endif // RINGCHAN_SHARED_STATE_CRTP_BASE_HPP
