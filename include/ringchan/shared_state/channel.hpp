#ifndef RINGCHAN_SHARED_STATE_CHANNEL_HPP
#define RINGCHAN_SHARED_STATE_CHANNEL_HPP

#include <atomic>
#include <coroutine>
#include <cstddef>
#include <functional>
#include <memory>
#include <memory_resource>
#include <optional>
#include <stdexcept>
#include <utility>

#include "../allocator.hpp"
#include "../log.hpp"
#include "concepts.hpp"
#include "crtp_base.hpp"
#include "policies.hpp"
#include "ring_buffer.hpp"
#include "wait_list.hpp"
#include "waker.hpp"

namespace ringchan {

// =============================================================================
// Channel Result - Result types for channel operations
// =============================================================================

enum class channel_op_status {
  success,
  closed,     // no receiver left (send) or drained with no sender left (receive)
  would_block // buffer full (send) or empty (receive); only from try_* calls
};

inline constexpr const char *to_string(channel_op_status status) noexcept {
  switch (status) {
  case channel_op_status::success:
    return "success";
  case channel_op_status::closed:
    return "Channel closed";
  case channel_op_status::would_block:
    return "Operation would block";
  }
  return "unknown";
}

template <typename T>
struct channel_result {
  std::optional<T> value;
  channel_op_status status;

  explicit operator bool() const { return status == channel_op_status::success; }

  T &operator*() { return *value; }
  const T &operator*() const { return *value; }
};

// A value that could not be enqueued is always handed back in `rejected`.
template <typename T>
struct send_result {
  channel_op_status status;
  std::optional<T> rejected;

  explicit operator bool() const { return status == channel_op_status::success; }
};

// =============================================================================
// Channel Phase
// =============================================================================
//
// open    - at least one sender is alive
// closing - every sender is gone, buffered values can still be received
// closed  - every sender is gone and the buffer is drained; terminal

enum class channel_phase { open, closing, closed };

inline constexpr const char *to_string(channel_phase phase) noexcept {
  switch (phase) {
  case channel_phase::open:
    return "open";
  case channel_phase::closing:
    return "closing";
  case channel_phase::closed:
    return "closed";
  }
  return "unknown";
}

// =============================================================================
// Channel Inner - State shared by every handle of one channel
// =============================================================================

template <typename T, typename LockPolicy = mutex_lock_policy>
class channel_inner {
public:
  channel_inner(std::size_t capacity, std::pmr::memory_resource *resource)
      : buffer(capacity, resource), capacity_(capacity) {}

  channel_inner(const channel_inner &) = delete;
  channel_inner &operator=(const channel_inner &) = delete;

  ring_buffer<T, LockPolicy> buffer;
  wait_list waiting_senders;
  wait_list waiting_receivers;

  void acquire_sender() noexcept {
    sender_count_.fetch_add(1, std::memory_order_relaxed);
  }

  // The last sender wakes every parked receiver so it can observe closing.
  void release_sender() {
    if (sender_count_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
      logger().debug("channel {}: last sender dropped, {} buffered, now {}",
                     static_cast<const void *>(this), buffer.size(),
                     to_string(phase()));
      waiting_receivers.wake_all();
    }
  }

  void acquire_receiver() noexcept {
    receiver_count_.fetch_add(1, std::memory_order_relaxed);
  }

  // The last receiver wakes every parked sender so it can report closed.
  void release_receiver() {
    if (receiver_count_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
      logger().debug("channel {}: last receiver dropped, sends now fail",
                     static_cast<const void *>(this));
      waiting_senders.wake_all();
    }
  }

  bool senders_alive() const noexcept {
    return sender_count_.load(std::memory_order_acquire) > 0;
  }

  bool receivers_alive() const noexcept {
    return receiver_count_.load(std::memory_order_acquire) > 0;
  }

  std::size_t sender_count() const noexcept {
    return sender_count_.load(std::memory_order_acquire);
  }

  std::size_t receiver_count() const noexcept {
    return receiver_count_.load(std::memory_order_acquire);
  }

  // True once no value can ever be received again; latches the closed phase.
  // The sender count is read before the buffer: with no sender alive nothing
  // can be pushed any more.
  bool is_drained() {
    if (closed_.load(std::memory_order_acquire)) {
      return true;
    }
    if (senders_alive() || !buffer.is_empty()) {
      return false;
    }
    if (!closed_.exchange(true, std::memory_order_acq_rel)) {
      logger().debug("channel {}: drained, now closed",
                     static_cast<const void *>(this));
    }
    return true;
  }

  channel_phase phase() const noexcept {
    if (closed_.load(std::memory_order_acquire)) {
      return channel_phase::closed;
    }
    if (senders_alive()) {
      return channel_phase::open;
    }
    return buffer.is_empty() ? channel_phase::closed : channel_phase::closing;
  }

  std::size_t capacity() const noexcept { return capacity_; }

private:
  std::atomic<std::size_t> sender_count_{0};
  std::atomic<std::size_t> receiver_count_{0};
  std::atomic<bool> closed_{false};
  const std::size_t capacity_;
};

template <typename T, typename LockPolicy> class sender;
template <typename T, typename LockPolicy> class receiver;
template <typename T, typename LockPolicy> class send_operation;
template <typename T, typename LockPolicy> class recv_operation;

// =============================================================================
// Sender - Cloneable producer handle
// =============================================================================

template <typename T, typename LockPolicy = mutex_lock_policy>
class sender {
  using inner_type = channel_inner<T, LockPolicy>;

  friend class send_operation<T, LockPolicy>;

public:
  using value_type = T;
  using lock_policy = LockPolicy;

  sender() = default;

  explicit sender(std::shared_ptr<inner_type> inner) : inner_(std::move(inner)) {
    if (inner_) {
      inner_->acquire_sender();
    }
  }

  sender(const sender &other) : inner_(other.inner_) {
    if (inner_) {
      inner_->acquire_sender();
    }
  }

  sender(sender &&other) noexcept : inner_(std::move(other.inner_)) {}

  sender &operator=(const sender &other) {
    if (this != &other) {
      sender copy(other);
      reset();
      inner_ = std::move(copy.inner_);
    }
    return *this;
  }

  sender &operator=(sender &&other) noexcept {
    if (this != &other) {
      reset();
      inner_ = std::move(other.inner_);
    }
    return *this;
  }

  ~sender() { reset(); }

  // Drops this handle's producer reference early.
  void reset() noexcept {
    if (auto inner = std::move(inner_)) {
      inner->release_sender();
    }
  }

  sender clone() const { return *this; }

  // Resumable send; poll() it or co_await it.
  send_operation<T, LockPolicy> send(T value) const {
    return send_operation<T, LockPolicy>(*this, std::move(value));
  }

  // Never suspends: would_block when full, closed when no receiver is left.
  send_result<T> try_send(T value) const {
    inner_type &inner = checked_inner();
    if (!inner.receivers_alive()) {
      return {channel_op_status::closed, std::move(value)};
    }
    if (!inner.buffer.try_push(std::move(value))) {
      return {channel_op_status::would_block, std::move(value)};
    }
    inner.waiting_receivers.wake_one();
    return {channel_op_status::success, std::nullopt};
  }

  // Parks the calling thread until the value is enqueued or the channel closes.
  send_result<T> send_blocking(T value) const {
    thread_parker parker;
    send_operation<T, LockPolicy> op(*this, std::move(value));
    while (op.poll(parker.get_waker()) == poll_status::pending) {
      parker.park();
    }
    return op.take_result();
  }

  // True when no receiver is left to take a value.
  bool is_closed() const { return !checked_inner().receivers_alive(); }

  channel_phase phase() const { return checked_inner().phase(); }

  std::size_t capacity() const { return checked_inner().capacity(); }

  // Sends currently suspended on a full buffer.
  std::size_t parked_senders() const {
    return checked_inner().waiting_senders.size();
  }

  explicit operator bool() const noexcept { return inner_ != nullptr; }

private:
  inner_type &checked_inner() const {
    if (!inner_) {
      throw std::logic_error("operation on an empty ringchan::sender");
    }
    return *inner_;
  }

  std::shared_ptr<inner_type> inner_;
};

// =============================================================================
// Receiver - Cloneable consumer handle
// =============================================================================

template <typename T, typename LockPolicy = mutex_lock_policy>
class receiver {
  using inner_type = channel_inner<T, LockPolicy>;

  friend class recv_operation<T, LockPolicy>;

public:
  using value_type = T;
  using lock_policy = LockPolicy;

  receiver() = default;

  explicit receiver(std::shared_ptr<inner_type> inner)
      : inner_(std::move(inner)) {
    if (inner_) {
      inner_->acquire_receiver();
    }
  }

  receiver(const receiver &other) : inner_(other.inner_) {
    if (inner_) {
      inner_->acquire_receiver();
    }
  }

  receiver(receiver &&other) noexcept : inner_(std::move(other.inner_)) {}

  receiver &operator=(const receiver &other) {
    if (this != &other) {
      receiver copy(other);
      reset();
      inner_ = std::move(copy.inner_);
    }
    return *this;
  }

  receiver &operator=(receiver &&other) noexcept {
    if (this != &other) {
      reset();
      inner_ = std::move(other.inner_);
    }
    return *this;
  }

  ~receiver() { reset(); }

  void reset() noexcept {
    if (auto inner = std::move(inner_)) {
      inner->release_receiver();
    }
  }

  receiver clone() const { return *this; }

  // Resumable receive; std::nullopt means the channel is closed for good.
  recv_operation<T, LockPolicy> recv() const {
    return recv_operation<T, LockPolicy>(*this);
  }

  channel_result<T> try_recv() const {
    inner_type &inner = checked_inner();
    if (auto value = inner.buffer.try_pop()) {
      inner.waiting_senders.wake_one();
      return {std::move(value), channel_op_status::success};
    }
    if (inner.is_drained()) {
      return {std::nullopt, channel_op_status::closed};
    }
    return {std::nullopt, channel_op_status::would_block};
  }

  std::optional<T> recv_blocking() const {
    thread_parker parker;
    recv_operation<T, LockPolicy> op(*this);
    while (op.poll(parker.get_waker()) == poll_status::pending) {
      parker.park();
    }
    return op.take_result();
  }

  bool is_closed() const {
    return checked_inner().phase() == channel_phase::closed;
  }

  channel_phase phase() const { return checked_inner().phase(); }

  std::size_t capacity() const { return checked_inner().capacity(); }

  // Buffered values; advisory under concurrent use.
  std::size_t size() const { return checked_inner().buffer.size(); }

  std::size_t parked_receivers() const {
    return checked_inner().waiting_receivers.size();
  }

  explicit operator bool() const noexcept { return inner_ != nullptr; }

private:
  inner_type &checked_inner() const {
    if (!inner_) {
      throw std::logic_error("operation on an empty ringchan::receiver");
    }
    return *inner_;
  }

  std::shared_ptr<inner_type> inner_;
};

// =============================================================================
// Send Operation - Resumable enqueue
// =============================================================================
//
// poll() protocol:
//   1. try the buffer; on success wake one parked receiver
//   2. on full, register a wait token, then try once more (a pop between the
//      first attempt and the registration would otherwise go unnoticed)
//   3. park the token; if a wake raced with the registration, retry instead
//
// The operation owns a sender clone, so the channel stays open while a send
// is in flight. As an awaiter, a wake re-polls on the scheduler pool and the
// coroutine is resumed only once the operation has completed.

template <typename T, typename LockPolicy = mutex_lock_policy>
class send_operation
    : public awaitable_base<send_operation<T, LockPolicy>, send_result<T>> {
  using inner_type = channel_inner<T, LockPolicy>;

public:
  send_operation(const sender<T, LockPolicy> &owner, T value)
      : owner_(owner), inner_(&owner_.checked_inner()),
        value_(std::move(value)) {}

  send_operation(const send_operation &) = delete;
  send_operation &operator=(const send_operation &) = delete;

  ~send_operation() { release_token(true); }

  poll_status poll(const waker &w) {
    if (taken_) {
      return poll_status::pending;
    }
    if (result_) {
      return poll_status::ready;
    }

    while (true) {
      if (try_complete()) {
        release_token(false);
        return poll_status::ready;
      }
      if (token_ && token_->is_parked() && token_->target().will_wake(w)) {
        return poll_status::pending;
      }

      release_token(false);
      auto token = inner_->waiting_senders.register_waiter(w);
      token_ = token;

      if (try_complete()) {
        release_token(true);
        return poll_status::ready;
      }
      if (token->park()) {
        return poll_status::pending;
      }
    }
  }

  send_result<T> take_result() {
    if (!result_ || taken_) {
      throw std::logic_error("send_operation result is not available");
    }
    taken_ = true;
    return std::move(*result_);
  }

  bool ready_impl() { return try_complete(); }

  bool suspend_impl(std::coroutine_handle<> h) {
    continuation_ = h;
    wake_target_ = waker(std::function<void()>([this] {
      schedule_task_on_pool([this] { resume_after_wake(); });
    }));
    return poll(wake_target_) == poll_status::pending;
  }

  send_result<T> resume_impl() { return take_result(); }

private:
  bool try_complete() {
    if (!inner_->receivers_alive()) {
      result_.emplace(send_result<T>{channel_op_status::closed, std::move(value_)});
      return true;
    }
    if (inner_->buffer.try_push(std::move(*value_))) {
      value_.reset();
      result_.emplace(send_result<T>{channel_op_status::success, std::nullopt});
      inner_->waiting_receivers.wake_one();
      return true;
    }
    return false;
  }

  void resume_after_wake() {
    if (poll(wake_target_) == poll_status::ready) {
      schedule_coro_handle(continuation_);
    }
  }

  // `forward` passes on a wake this token received but never acted on.
  void release_token(bool forward) {
    if (!token_) {
      return;
    }
    if (token_->cancel() == token_state::notified && forward) {
      logger().trace("send_operation: forwarding unused wake");
      inner_->waiting_senders.wake_one();
    }
    token_.reset();
  }

  sender<T, LockPolicy> owner_;
  inner_type *inner_;
  std::optional<T> value_;
  std::optional<send_result<T>> result_;
  bool taken_{false};
  std::shared_ptr<wait_token> token_;
  waker wake_target_;
  std::coroutine_handle<> continuation_{nullptr};
};

// =============================================================================
// Receive Operation - Resumable dequeue
// =============================================================================

template <typename T, typename LockPolicy = mutex_lock_policy>
class recv_operation
    : public awaitable_base<recv_operation<T, LockPolicy>, std::optional<T>> {
  using inner_type = channel_inner<T, LockPolicy>;

public:
  explicit recv_operation(const receiver<T, LockPolicy> &owner)
      : owner_(owner), inner_(&owner_.checked_inner()) {}

  recv_operation(const recv_operation &) = delete;
  recv_operation &operator=(const recv_operation &) = delete;

  ~recv_operation() { release_token(true); }

  poll_status poll(const waker &w) {
    if (taken_) {
      return poll_status::pending;
    }
    if (completed_) {
      return poll_status::ready;
    }

    while (true) {
      if (try_complete()) {
        release_token(false);
        return poll_status::ready;
      }
      if (token_ && token_->is_parked() && token_->target().will_wake(w)) {
        return poll_status::pending;
      }

      release_token(false);
      auto token = inner_->waiting_receivers.register_waiter(w);
      token_ = token;

      if (try_complete()) {
        release_token(true);
        return poll_status::ready;
      }
      if (token->park()) {
        return poll_status::pending;
      }
    }
  }

  std::optional<T> take_result() {
    if (!completed_ || taken_) {
      throw std::logic_error("recv_operation result is not available");
    }
    taken_ = true;
    return std::move(value_);
  }

  bool ready_impl() { return try_complete(); }

  bool suspend_impl(std::coroutine_handle<> h) {
    continuation_ = h;
    wake_target_ = waker(std::function<void()>([this] {
      schedule_task_on_pool([this] { resume_after_wake(); });
    }));
    return poll(wake_target_) == poll_status::pending;
  }

  std::optional<T> resume_impl() { return take_result(); }

private:
  bool try_complete() {
    if (auto value = inner_->buffer.try_pop()) {
      value_ = std::move(value);
      completed_ = true;
      inner_->waiting_senders.wake_one();
      return true;
    }
    if (inner_->is_drained()) {
      completed_ = true;
      return true;
    }
    return false;
  }

  void resume_after_wake() {
    if (poll(wake_target_) == poll_status::ready) {
      schedule_coro_handle(continuation_);
    }
  }

  void release_token(bool forward) {
    if (!token_) {
      return;
    }
    if (token_->cancel() == token_state::notified && forward) {
      logger().trace("recv_operation: forwarding unused wake");
      inner_->waiting_receivers.wake_one();
    }
    token_.reset();
  }

  receiver<T, LockPolicy> owner_;
  inner_type *inner_;
  std::optional<T> value_;
  bool completed_{false};
  bool taken_{false};
  std::shared_ptr<wait_token> token_;
  waker wake_target_;
  std::coroutine_handle<> continuation_{nullptr};
};

// =============================================================================
// Construction
// =============================================================================

// Throws std::invalid_argument when capacity is not a power of two and
// std::length_error when the slot storage would not be addressable.
template <typename T, typename LockPolicy = mutex_lock_policy>
std::pair<sender<T, LockPolicy>, receiver<T, LockPolicy>>
make_channel(std::size_t capacity,
             std::pmr::memory_resource *resource = mi_resource()) {
  std::shared_ptr<channel_inner<T, LockPolicy>> inner;
  try {
    inner = std::make_shared<channel_inner<T, LockPolicy>>(capacity, resource);
  } catch (const std::logic_error &e) {
    logger().error("channel construction rejected: {}", e.what());
    throw;
  }
  logger().debug("channel {}: created with capacity {} ({} usable)",
                 static_cast<const void *>(inner.get()), capacity,
                 capacity - 1);
  sender<T, LockPolicy> tx(inner);
  receiver<T, LockPolicy> rx(std::move(inner));
  return {std::move(tx), std::move(rx)};
}

template <typename T>
std::pair<sender<T>, receiver<T>> channel(std::size_t capacity) {
  return make_channel<T>(capacity);
}

} // namespace ringchan

#endif // RINGCHAN_SHARED_STATE_CHANNEL_HPP
