#ifndef RINGCHAN_CORO_TASK_HPP
#define RINGCHAN_CORO_TASK_HPP

#include "continuation_handoff.hpp"

#include <atomic>
#include <condition_variable>
#include <coroutine>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace ringchan {

void schedule_coro_handle(std::coroutine_handle<> handle);

// Completion state shared between a coroutine frame and its coro_task. It
// outlives the frame so blocking waiters never touch freed memory.
struct coro_state_base {
  std::exception_ptr exception;
  std::atomic<bool> ready{false};
  continuation_handoff handoff;
  std::mutex mutex;
  std::condition_variable cv;

  void publish() {
    {
      std::lock_guard lock(mutex);
      ready.store(true, std::memory_order_release);
    }
    cv.notify_all();
  }

  void wait() {
    std::unique_lock lock(mutex);
    cv.wait(lock, [this] { return ready.load(std::memory_order_acquire); });
  }

  void rethrow_if_failed() const {
    if (exception) {
      std::rethrow_exception(exception);
    }
  }

  bool is_ready() const { return ready.load(std::memory_order_acquire); }
};

template <typename T> struct coro_shared_state : coro_state_base {
  std::optional<T> value;

  void set_value(T v) { value.emplace(std::move(v)); }

  T get() {
    wait();
    rethrow_if_failed();
    return std::move(*value);
  }
};

template <> struct coro_shared_state<void> : coro_state_base {
  void get() {
    wait();
    rethrow_if_failed();
  }
};

namespace detail {

template <typename T> struct promise_result {
  std::shared_ptr<coro_shared_state<T>> state =
      std::make_shared<coro_shared_state<T>>();

  void return_value(T value) { state->set_value(std::move(value)); }
};

template <> struct promise_result<void> {
  std::shared_ptr<coro_shared_state<void>> state =
      std::make_shared<coro_shared_state<void>>();

  void return_void() {}
};

} // namespace detail

// Lazily started coroutine. Runs on the worker pool once start() is called or
// it is co_awaited; get() blocks a plain thread until the result is in.
template <typename T = void> class coro_task {
public:
  struct promise_type;
  using handle_type = std::coroutine_handle<promise_type>;

  struct promise_type : detail::promise_result<T> {
    coro_task get_return_object() {
      return coro_task{handle_type::from_promise(*this)};
    }

    std::suspend_always initial_suspend() noexcept { return {}; }

    struct final_awaiter {
      bool await_ready() noexcept { return false; }

      // The frame may be destroyed by a waiter as soon as publish() runs, so
      // only locals are used after that point.
      std::coroutine_handle<>
      await_suspend(std::coroutine_handle<promise_type> h) noexcept {
        std::shared_ptr<coro_shared_state<T>> state = h.promise().state;
        std::coroutine_handle<> next = state->handoff.set_ready();
        state->publish();
        return next;
      }

      void await_resume() noexcept {}
    };

    final_awaiter final_suspend() noexcept { return {}; }

    void unhandled_exception() { this->state->exception = std::current_exception(); }
  };

  coro_task(const coro_task &) = delete;
  coro_task &operator=(const coro_task &) = delete;

  coro_task(coro_task &&other) noexcept
      : handle_(std::exchange(other.handle_, nullptr)),
        state_(std::move(other.state_)),
        started_(other.started_.load(std::memory_order_acquire)) {}

  coro_task &operator=(coro_task &&other) noexcept {
    if (this != &other) {
      release();
      handle_ = std::exchange(other.handle_, nullptr);
      state_ = std::move(other.state_);
      started_.store(other.started_.load(std::memory_order_acquire),
                     std::memory_order_release);
    }
    return *this;
  }

  ~coro_task() { release(); }

  // Hands the frame to the worker pool. Idempotent.
  void start() {
    if (handle_ && !started_.exchange(true, std::memory_order_acq_rel)) {
      schedule_coro_handle(handle_);
    }
  }

  T get() {
    start();
    return state_->get();
  }

  bool is_ready() const { return state_ && state_->is_ready(); }
  bool is_started() const { return started_.load(std::memory_order_acquire); }

  bool await_ready() const { return is_ready(); }

  bool await_suspend(std::coroutine_handle<> awaiting) {
    if (!state_->handoff.set_continuation(awaiting)) {
      return false;
    }
    start();
    return true;
  }

  T await_resume() { return state_->get(); }

private:
  explicit coro_task(handle_type h) : handle_(h), state_(h.promise().state) {}

  void release() {
    if (!handle_) {
      return;
    }
    if (started_.load(std::memory_order_acquire)) {
      state_->wait();
    }
    handle_.destroy();
    handle_ = nullptr;
  }

  handle_type handle_;
  std::shared_ptr<coro_shared_state<T>> state_;
  std::atomic<bool> started_{false};
};

} // namespace ringchan

#endif // RINGCHAN_CORO_TASK_HPP
