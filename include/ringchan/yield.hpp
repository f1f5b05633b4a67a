#ifndef RINGCHAN_YIELD_HPP
#define RINGCHAN_YIELD_HPP

#include <coroutine>

namespace ringchan {

void schedule_coro_handle(std::coroutine_handle<> handle);

// Puts the current coroutine at the back of the worker queue
struct yield_awaiter {
  bool await_ready() noexcept { return false; }
  void await_suspend(std::coroutine_handle<> h) { schedule_coro_handle(h); }
  void await_resume() noexcept {}
};

inline yield_awaiter yield() { return {}; }

} // namespace ringchan

#endif // RINGCHAN_YIELD_HPP
