#include "faq_api/request_tracker.hpp"

namespace faq_api {

bool RequestTracker::try_enter() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return false;
  }
  ++in_flight_;
  return true;
}

void RequestTracker::leave() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (in_flight_ > 0 && --in_flight_ == 0) {
    idle_cv_.notify_all();
  }
}

void RequestTracker::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = true;
}

bool RequestTracker::wait_idle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return idle_cv_.wait_for(lock, timeout, [this] { return in_flight_ == 0; });
}

std::size_t RequestTracker::in_flight() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return in_flight_;
}

bool RequestTracker::is_closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

}  // namespace faq_api
