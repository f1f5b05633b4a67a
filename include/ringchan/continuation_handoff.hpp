#ifndef RINGCHAN_CONTINUATION_HANDOFF_HPP
#define RINGCHAN_CONTINUATION_HANDOFF_HPP

#include <atomic>
#include <coroutine>
#include <cstdint>

namespace ringchan {

// One-shot race resolution between a task finishing (set_ready) and an
// awaiter attaching its continuation (set_continuation). Exactly one side
// ends up resuming the continuation.
//
// State encoding (single atomic):
//   Bit 0: READY flag (task has completed)
//   Bits 1+: continuation address (naturally aligned, so bit 0 is always 0)
class continuation_handoff {
public:
  static constexpr std::uintptr_t READY_FLAG = 1;
  static constexpr std::uintptr_t ADDR_MASK = ~std::uintptr_t(1);

  continuation_handoff() = default;
  continuation_handoff(const continuation_handoff &) = delete;
  continuation_handoff &operator=(const continuation_handoff &) = delete;

  // Task side. Returns the continuation to transfer to, or noop_coroutine()
  // when nobody is attached yet (the awaiter will see READY instead).
  std::coroutine_handle<> set_ready() noexcept {
    const std::uintptr_t old_val =
        state_.fetch_or(READY_FLAG, std::memory_order_acq_rel);
    if (old_val & ADDR_MASK) {
      return std::coroutine_handle<>::from_address(
          reinterpret_cast<void *>(old_val & ADDR_MASK));
    }
    return std::noop_coroutine();
  }

  // Awaiter side. False when the task already completed: the caller must not
  // suspend.
  bool set_continuation(std::coroutine_handle<> h) noexcept {
    const auto addr = reinterpret_cast<std::uintptr_t>(h.address());
    std::uintptr_t expected = 0;
    return state_.compare_exchange_strong(expected, addr,
                                          std::memory_order_acq_rel,
                                          std::memory_order_acquire);
  }

  bool is_ready() const noexcept {
    return (state_.load(std::memory_order_acquire) & READY_FLAG) != 0;
  }

private:
  std::atomic<std::uintptr_t> state_{0};
};

} // namespace ringchan

#endif // RINGCHAN_CONTINUATION_HANDOFF_HPP
