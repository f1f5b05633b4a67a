#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <utility>

#include "ringchan/log.hpp"
#include "ringchan/task_scheduler.hpp"

namespace ringchan {

thread_local bool task_scheduler::is_worker = false;
thread_local std::size_t task_scheduler::current_worker_id = 0;

std::size_t task_scheduler::default_worker_count() {
  if (const char *env = std::getenv("RINGCHAN_WORKERS")) {
    std::size_t requested = 0;
    const char *end = env + std::strlen(env);
    auto [ptr, ec] = std::from_chars(env, end, requested);
    if (ec == std::errc{} && ptr == end && requested > 0) {
      return requested;
    }
    logger().warn("ignoring invalid RINGCHAN_WORKERS value '{}'", env);
  }
  return std::max<std::size_t>(2, std::thread::hardware_concurrency());
}

task_scheduler::task_scheduler(std::size_t worker_count) {
  if (worker_count == 0) {
    worker_count = 1;
  }
  workers.reserve(worker_count);
  for (std::size_t id = 0; id < worker_count; ++id) {
    workers.emplace_back(&task_scheduler::worker_loop, this, id);
  }
  logger().debug("task scheduler started with {} workers", worker_count);
}

task_scheduler::~task_scheduler() {
  {
    std::lock_guard<std::mutex> lock(queue_mutex);
    shutting_down.store(true, std::memory_order_release);
  }
  queue_cv.notify_all();

  for (auto &worker : workers) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  logger().debug("task scheduler stopped");
}

void task_scheduler::worker_loop(std::size_t id) {
  is_worker = true;
  current_worker_id = id;

  while (true) {
    task next;
    {
      std::unique_lock<std::mutex> lock(queue_mutex);
      queue_cv.wait(lock, [this] {
        return shutting_down.load(std::memory_order_acquire) || !queue.empty();
      });
      // Drain everything queued before shutdown was requested.
      if (queue.empty()) {
        return;
      }
      next = std::move(queue.front());
      queue.pop_front();
    }
    run_guarded(next);
  }
}

void task_scheduler::run_guarded(task &t) {
  try {
    t();
  } catch (const std::exception &e) {
    logger().error("task on worker {} threw: {}", current_worker_id, e.what());
  }
}

void task_scheduler::schedule_task(task t) {
  bool queued = false;
  {
    std::lock_guard<std::mutex> lock(queue_mutex);
    if (!shutting_down.load(std::memory_order_acquire)) {
      queue.push_back(std::move(t));
      queued = true;
    }
  }
  if (queued) {
    queue_cv.notify_one();
    return;
  }
  run_guarded(t);
}

void task_scheduler::schedule_coro_handle(std::coroutine_handle<> handle) {
  if (!handle || handle.done()) {
    return;
  }
  schedule_task([handle] { handle.resume(); });
}

task_scheduler g_global_task_scheduler;

void schedule_coro_handle(std::coroutine_handle<> handle) {
  g_global_task_scheduler.schedule_coro_handle(handle);
}

void schedule_task_on_pool(std::function<void()> task) {
  g_global_task_scheduler.schedule_task(std::move(task));
}

} // namespace ringchan
