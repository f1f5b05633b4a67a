#include <atomic>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <memory_resource>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "ringchan/shared_state/ring_buffer.hpp"

using namespace ringchan;

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

// Counts live instances so teardown can be checked.
struct tracked {
  static inline std::atomic<int> live{0};
  int id;

  explicit tracked(int i) : id(i) { ++live; }
  tracked(const tracked &other) : id(other.id) { ++live; }
  tracked(tracked &&other) noexcept : id(other.id) { ++live; }
  ~tracked() { --live; }
};

// Move-only payload
struct ticket {
  std::unique_ptr<int> number;
};

// =============================================================================
// Basic Operations
// =============================================================================

void test_basic_operations() {
  TEST("push then pop a single value") {
    ring_buffer<int> rb(4);
    assert(rb.is_empty());
    assert(rb.try_push(7));
    assert(!rb.is_empty());
    auto value = rb.try_pop();
    assert(value.has_value());
    assert(*value == 7);
    assert(rb.is_empty());
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("pop until empty") {
    ring_buffer<int> rb(8);
    for (int i = 0; i < 5; ++i) {
      assert(rb.try_push(i));
    }
    assert(rb.size() == 5);
    for (int i = 0; i < 5; ++i) {
      auto value = rb.try_pop();
      assert(value && *value == i);
    }
    assert(!rb.try_pop().has_value());
    assert(rb.size() == 0);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("push until full keeps one slot free") {
    ring_buffer<int> rb(2);
    assert(rb.usable_capacity() == 1);
    assert(rb.try_push(1));
    assert(rb.is_full());
    int rejected = 2;
    assert(!rb.try_push(rejected));
    assert(rejected == 2);
    assert(*rb.try_pop() == 1);
    assert(rb.try_push(rejected));
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("rejected push leaves a move-only value with the caller") {
    ring_buffer<ticket> rb(2);
    assert(rb.try_push(ticket{std::make_unique<int>(1)}));
    ticket second{std::make_unique<int>(2)};
    assert(!rb.try_push(std::move(second)));
    assert(second.number && *second.number == 2);
    auto first = rb.try_pop();
    assert(first && *first->number == 1);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("wrap-around with strings") {
    ring_buffer<std::string> rb(4);
    assert(rb.try_push(std::string("hi")));
    assert(rb.try_push(std::string("test")));
    assert(rb.try_push(std::string("String")));
    assert(rb.is_full());

    auto first = rb.try_pop();
    assert(first && *first == "hi");

    assert(rb.try_push(std::string("Wrapped")));
    assert(rb.head() == 0);
    assert(rb.tail() == 1);
    assert(rb.is_full());

    assert(*rb.try_pop() == "test");
    assert(*rb.try_pop() == "String");
    assert(*rb.try_pop() == "Wrapped");
    assert(rb.is_empty());
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Capacity Precondition
// =============================================================================

void test_capacity_precondition() {
  TEST("non power-of-two capacities are rejected") {
    for (std::size_t bad : {0u, 3u, 6u, 12u, 100u}) {
      bool threw = false;
      try {
        ring_buffer<int> rb(bad);
      } catch (const std::invalid_argument &) {
        threw = true;
      }
      assert(threw);
    }
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("capacity beyond addressable slot storage is rejected") {
    // A power of two, but capacity * sizeof(std::uint64_t) wraps.
    const std::size_t huge = std::size_t{1}
                             << (std::numeric_limits<std::size_t>::digits - 1);
    bool threw = false;
    try {
      ring_buffer<std::uint64_t> rb(huge, std::pmr::new_delete_resource());
      rb.try_push(std::uint64_t{0});
    } catch (const std::length_error &) {
      threw = true;
    }
    assert(threw);

    // Ordinary capacities of the same element type are unaffected.
    ring_buffer<std::uint64_t> fits(64);
    assert(fits.try_push(std::uint64_t{7}));
    assert(*fits.try_pop() == 7);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("power-of-two capacities are accepted") {
    for (std::size_t good : {1u, 2u, 4u, 64u, 1024u}) {
      ring_buffer<int> rb(good);
      assert(rb.capacity() == good);
      assert(rb.usable_capacity() == good - 1);
    }
    ring_buffer<int> single(1);
    assert(single.is_full());
    assert(!single.try_push(1));
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Teardown
// =============================================================================

void test_teardown() {
  TEST("destruction releases resident values exactly once") {
    tracked::live = 0;
    {
      ring_buffer<tracked> rb(8);
      for (int i = 0; i < 6; ++i) {
        assert(rb.try_push(tracked(i)));
      }
      for (int i = 0; i < 4; ++i) {
        auto value = rb.try_pop();
        assert(value && value->id == i);
      }
      // Wrap the live range around the end of the storage.
      for (int i = 6; i < 11; ++i) {
        assert(rb.try_push(tracked(i)));
      }
      assert(tracked::live == 7);
    }
    assert(tracked::live == 0);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("storage comes from the supplied resource") {
    std::pmr::monotonic_buffer_resource arena;
    {
      ring_buffer<std::string> rb(16, &arena);
      assert(rb.try_push(std::string("arena")));
      assert(*rb.try_pop() == "arena");
    }
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Concurrency
// =============================================================================

template <typename Policy> void run_threaded_push_pop(const char *name) {
  TEST(name) {
    constexpr int producers = 4;
    constexpr int per_producer = 5000;
    ring_buffer<int, Policy> rb(64);
    std::atomic<int> consumed{0};
    std::vector<int> seen(producers * per_producer, 0);
    std::mutex seen_mutex;

    std::vector<std::thread> threads;
    for (int p = 0; p < producers; ++p) {
      threads.emplace_back([&, p] {
        for (int i = 0; i < per_producer; ++i) {
          const int value = p * per_producer + i;
          while (!rb.try_push(value)) {
            std::this_thread::yield();
          }
        }
      });
    }
    for (int c = 0; c < 2; ++c) {
      threads.emplace_back([&] {
        while (consumed.load() < producers * per_producer) {
          if (auto value = rb.try_pop()) {
            std::lock_guard<std::mutex> lock(seen_mutex);
            ++seen[*value];
            ++consumed;
          } else {
            std::this_thread::yield();
          }
        }
      });
    }
    for (auto &t : threads) {
      t.join();
    }

    for (int count : seen) {
      assert(count == 1);
    }
    assert(rb.is_empty());
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

void test_concurrency() {
  run_threaded_push_pop<mutex_lock_policy>("threaded push/pop with mutex policy");
  run_threaded_push_pop<spinlock_policy>("threaded push/pop with spinlock policy");
}

int main() {
  std::cout << "=== Ring Buffer Tests ===" << std::endl << std::endl;

  std::cout << "--- Basic Operations ---" << std::endl;
  test_basic_operations();
  std::cout << std::endl;

  std::cout << "--- Capacity Precondition ---" << std::endl;
  test_capacity_precondition();
  std::cout << std::endl;

  std::cout << "--- Teardown ---" << std::endl;
  test_teardown();
  std::cout << std::endl;

  std::cout << "--- Concurrency ---" << std::endl;
  test_concurrency();
  std::cout << std::endl;

  std::cout << "=== Results ===" << std::endl;
  std::cout << "Passed: " << tests_passed << std::endl;
  std::cout << "Failed: " << tests_failed << std::endl;

  return tests_failed > 0 ? 1 : 0;
}
