#include "ringchan/shared_state/waker.hpp"

namespace ringchan {

void waker::wake() const {
  if (callback_) {
    (*callback_)();
  }
}

// The waker holds the state by shared_ptr: a late wake from a wait-list can
// outlive the parker itself.
thread_parker::thread_parker()
    : state_(std::make_shared<state>()),
      waker_(std::function<void()>([s = state_]() {
        {
          std::lock_guard<std::mutex> lock(s->mutex);
          s->notified = true;
        }
        s->cv.notify_one();
      })) {}

void thread_parker::park() {
  std::unique_lock<std::mutex> lock(state_->mutex);
  state_->cv.wait(lock, [this] { return state_->notified; });
  state_->notified = false;
}

void thread_parker::unpark() { waker_.wake(); }

} // namespace ringchan
