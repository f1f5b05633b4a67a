#ifndef RINGCHAN_TASK_SCHEDULER_HPP
#define RINGCHAN_TASK_SCHEDULER_HPP

#include <atomic>
#include <condition_variable>
#include <coroutine>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "coro_task.hpp"

/*
  Worker pool that drives every coroutine in the library. Suspended channel
  operations never block a worker: their wakers push a re-poll task or the
  coroutine handle onto the shared injection queue, and any idle worker picks
  it up. The pool size comes from RINGCHAN_WORKERS when set, otherwise from
  the hardware concurrency (at least two workers).
*/

namespace ringchan {

using task = std::function<void()>;

struct task_scheduler {
  std::vector<std::thread> workers;
  std::deque<task> queue;
  std::mutex queue_mutex;
  std::condition_variable queue_cv;
  std::atomic<bool> shutting_down{false};

  static thread_local bool is_worker;
  static thread_local std::size_t current_worker_id;

  template <typename T> coro_task<T> add_coro(coro_task<T> task);

  // Resume a suspended coroutine on a worker
  void schedule_coro_handle(std::coroutine_handle<> handle);

  // Run an arbitrary callable on a worker. During shutdown it runs inline.
  void schedule_task(task t);

  std::size_t worker_count() const { return workers.size(); }

  static std::size_t default_worker_count();

  explicit task_scheduler(std::size_t worker_count = default_worker_count());
  ~task_scheduler();

  task_scheduler(const task_scheduler &) = delete;
  task_scheduler &operator=(const task_scheduler &) = delete;

private:
  void worker_loop(std::size_t id);
  static void run_guarded(task &t);
};

extern task_scheduler g_global_task_scheduler;

template <typename T>
coro_task<T> task_scheduler::add_coro(coro_task<T> task) {
  task.start();
  return task;
}

template <typename T> coro_task<T> add_coro(coro_task<T> task) {
  return g_global_task_scheduler.add_coro(std::move(task));
}

} // namespace ringchan

#endif // RINGCHAN_TASK_SCHEDULER_HPP
