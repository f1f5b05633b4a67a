#ifndef RINGCHAN_SHARED_STATE_CONCEPTS_HPP
#define RINGCHAN_SHARED_STATE_CONCEPTS_HPP

#include <concepts>
#include <coroutine>
#include <optional>
#include <type_traits>

namespace ringchan {

// =============================================================================
// Core Type Concepts
// =============================================================================

// Values stored in a ring buffer are moved in and moved out of raw slots.
template <typename T>
concept Transferable =
    std::move_constructible<T> && std::destructible<T> && !std::is_reference_v<T>;

// =============================================================================
// Coroutine Awaitable Concepts
// =============================================================================

template <typename T>
concept Awaiter = requires(T a, std::coroutine_handle<> h) {
  { a.await_ready() } -> std::convertible_to<bool>;
  { a.await_suspend(h) };
  { a.await_resume() };
};

// =============================================================================
// Lockable Concepts (std::mutex-like)
// =============================================================================

template <typename T>
concept BasicLockable = requires(T m) {
  { m.lock() } -> std::same_as<void>;
  { m.unlock() } -> std::same_as<void>;
};

template <typename T>
concept Lockable = BasicLockable<T> && requires(T m) {
  { m.try_lock() } -> std::convertible_to<bool>;
};

// =============================================================================
// Policy Concepts
// =============================================================================

template <typename P>
concept LockPolicy = requires {
  typename P::mutex_type;
  typename P::lock_type;
} && Lockable<typename P::mutex_type>;

// =============================================================================
// Channel Handle Concepts
// =============================================================================

template <typename S, typename T>
concept ChannelSender = std::copy_constructible<S> && requires(S s, T value) {
  { s.send(std::move(value)) } -> Awaiter;
  { s.try_send(std::move(value)) };
  { s.is_closed() } -> std::convertible_to<bool>;
};

template <typename R, typename T>
concept ChannelReceiver = std::copy_constructible<R> && requires(R r) {
  { r.recv() } -> Awaiter;
  { r.recv_blocking() } -> std::convertible_to<std::optional<T>>;
  { r.is_closed() } -> std::convertible_to<bool>;
};

// =============================================================================
// Type Traits for Detection
// =============================================================================

template <typename P>
inline constexpr bool is_lock_policy_v = LockPolicy<P>;

} // namespace ringchan

#endif // RINGCHAN_SHARED_STATE_CONCEPTS_HPP
