#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "ringchan/async_runtime.hpp"
#include "ringchan/shared_state.hpp"
#include "ringchan/task_scheduler.hpp"

using namespace ringchan;
using namespace std::chrono_literals;

// =============================================================================
// Test Counters
// =============================================================================

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name)                                                             \
  std::cout << "Testing " << name << "... ";                                   \
  try

#define PASS()                                                                 \
  std::cout << "PASSED" << std::endl;                                          \
  ++tests_passed

#define FAIL(msg)                                                              \
  std::cout << "FAILED: " << msg << std::endl;                                 \
  ++tests_failed

// =============================================================================
// Test coroutines
// =============================================================================

// Handles passed by value live in the coroutine frame until the task object is
// destroyed, so producers drop theirs explicitly once done.

coro_task<channel_op_status> send_one(sender<std::string> tx, std::string value) {
  auto result = co_await tx.send(std::move(value));
  tx.reset();
  co_return result.status;
}

coro_task<void> produce(sender<int> tx, int producer, int count) {
  for (int i = 0; i < count; ++i) {
    auto result = co_await tx.send(producer * count + i);
    if (!result) {
      throw std::runtime_error(to_string(result.status));
    }
    if (i % 97 == 0) {
      co_await yield();
    }
  }
  tx.reset();
}

coro_task<std::vector<int>> consume(receiver<int> rx) {
  std::vector<int> received;
  while (auto value = co_await rx.recv()) {
    received.push_back(*value);
  }
  co_return received;
}

// Values from one producer must appear in send order within any consumer.
static bool fifo_per_producer(const std::vector<int> &received, int count) {
  std::vector<int> last(64, -1);
  for (int value : received) {
    const int producer = value / count;
    if (value <= last[producer]) {
      return false;
    }
    last[producer] = value;
  }
  return true;
}

static void run_mpmc(std::size_t capacity, int producers, int consumers,
                     int per_producer) {
  auto [tx, rx] = make_channel<int>(capacity);

  std::vector<coro_task<void>> senders;
  for (int p = 0; p < producers; ++p) {
    senders.push_back(add_coro(produce(tx.clone(), p, per_producer)));
  }
  std::vector<coro_task<std::vector<int>>> receivers;
  for (int c = 0; c < consumers; ++c) {
    receivers.push_back(consume(rx.clone()));
  }
  tx.reset();
  rx.reset();

  auto results = g_runtime.block_on(when_all(std::move(receivers)));
  g_runtime.block_on(when_all(std::move(senders)));

  std::vector<int> all;
  for (const auto &received : results) {
    assert(fifo_per_producer(received, per_producer));
    all.insert(all.end(), received.begin(), received.end());
  }
  std::sort(all.begin(), all.end());
  assert(all.size() == static_cast<std::size_t>(producers * per_producer));
  for (std::size_t i = 0; i < all.size(); ++i) {
    assert(all[i] == static_cast<int>(i));
  }
}

// =============================================================================
// Tests
// =============================================================================

void test_concrete_scenario() {
  TEST("capacity 4 backpressure and close sequence") {
    auto scenario = []() -> coro_task<bool> {
      auto [tx, rx] = make_channel<std::string>(4);
      for (const char *value : {"1", "2", "3"}) {
        auto sent = co_await tx.send(std::string(value));
        if (!sent) {
          co_return false;
        }
      }

      auto blocked = add_coro(send_one(tx.clone(), "4"));
      while (tx.parked_senders() == 0) {
        co_await yield();
      }
      if (blocked.is_ready()) {
        co_return false;
      }
      tx.reset();

      auto first = co_await rx.recv();
      if (first != std::string("1")) {
        co_return false;
      }
      if (co_await blocked != channel_op_status::success) {
        co_return false;
      }

      for (const char *expected : {"2", "3", "4"}) {
        auto value = co_await rx.recv();
        if (value != std::string(expected)) {
          co_return false;
        }
      }

      auto end = co_await rx.recv();
      co_return !end.has_value() && rx.is_closed();
    };

    assert(g_runtime.run(scenario()));
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

void test_mpmc() {
  TEST("4 producers x 2500 values, 4 consumers") {
    run_mpmc(16, 4, 4, 2500);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("capacity sweep") {
    for (std::size_t capacity : {4u, 8u, 16u, 32u, 64u}) {
      run_mpmc(capacity, 3, 2, 1000);
    }
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("single slot channel still makes progress") {
    run_mpmc(2, 2, 2, 500);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

void test_blocking_api() {
  TEST("blocking senders and receivers on plain threads") {
    constexpr int producers = 3;
    constexpr int per_producer = 2000;
    auto [tx, rx] = make_channel<int>(8);

    std::vector<std::thread> threads;
    for (int p = 0; p < producers; ++p) {
      threads.emplace_back([p, tx = tx.clone()]() mutable {
        for (int i = 0; i < per_producer; ++i) {
          auto result = tx.send_blocking(p * per_producer + i);
          assert(result);
        }
        tx.reset();
      });
    }
    tx.reset();

    std::atomic<int> total{0};
    std::vector<std::vector<int>> received(2);
    std::vector<std::thread> consumers;
    for (int c = 0; c < 2; ++c) {
      consumers.emplace_back([c, &received, &total, rx = rx.clone()] {
        while (auto value = rx.recv_blocking()) {
          received[c].push_back(*value);
          ++total;
        }
      });
    }
    rx.reset();

    for (auto &t : threads) {
      t.join();
    }
    for (auto &t : consumers) {
      t.join();
    }

    assert(total == producers * per_producer);
    for (const auto &values : received) {
      assert(fifo_per_producer(values, per_producer));
    }
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("coroutine producer, blocking consumer") {
    auto [tx, rx] = make_channel<int>(4);
    auto producer = add_coro(produce(tx.clone(), 0, 300));
    tx.reset();

    int expected = 0;
    while (auto value = rx.recv_blocking()) {
      assert(*value == expected);
      ++expected;
    }
    assert(expected == 300);
    producer.get();
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("blocking send fails once receivers are gone") {
    auto [tx, rx] = make_channel<int>(2);
    assert(tx.send_blocking(1));

    std::thread dropper([rx = std::move(rx)]() mutable {
      std::this_thread::sleep_for(20ms);
      rx.reset();
    });
    auto result = tx.send_blocking(2);
    dropper.join();

    assert(result.status == channel_op_status::closed);
    assert(result.rejected == 2);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

int main() {
  std::cout << "=== Channel Tests ===" << std::endl << std::endl;

  std::cout << "--- Concrete Scenario ---" << std::endl;
  test_concrete_scenario();
  std::cout << std::endl;

  std::cout << "--- MPMC ---" << std::endl;
  test_mpmc();
  std::cout << std::endl;

  std::cout << "--- Blocking API ---" << std::endl;
  test_blocking_api();
  std::cout << std::endl;

  std::cout << "=== Results ===" << std::endl;
  std::cout << "Passed: " << tests_passed << std::endl;
  std::cout << "Failed: " << tests_failed << std::endl;

  return tests_failed > 0 ? 1 : 0;
}
