#ifndef RINGCHAN_ASYNC_RUNTIME_HPP
#define RINGCHAN_ASYNC_RUNTIME_HPP

#include <cstddef>
#include <utility>
#include <vector>

#include "coro_task.hpp"
#include "yield.hpp"

namespace ringchan {

// =============================================================================
// Async Runtime - entry point from plain threads into coroutine code
// =============================================================================

class async_runtime {
public:
  // Run a single coroutine to completion on the pool, return its result
  template <typename T> T run(coro_task<T> task) {
    task.start();
    return task.get();
  }

  template <typename T> T block_on(coro_task<T> task) {
    return run(std::move(task));
  }
};

extern async_runtime g_runtime;

// =============================================================================
// Structured Concurrency: when_all
// =============================================================================

// Results come back in the order of the input tasks
template <typename T>
coro_task<std::vector<T>> when_all(std::vector<coro_task<T>> tasks) {
  for (auto &t : tasks) {
    t.start();
  }

  std::vector<T> results;
  results.reserve(tasks.size());
  for (auto &t : tasks) {
    results.push_back(co_await t);
  }

  co_return results;
}

inline coro_task<void> when_all(std::vector<coro_task<void>> tasks) {
  for (auto &t : tasks) {
    t.start();
  }
  for (auto &t : tasks) {
    co_await t;
  }
}

} // namespace ringchan

#endif // RINGCHAN_ASYNC_RUNTIME_HPP
