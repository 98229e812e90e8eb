#pragma once

#include <atomic>

namespace faq_core {

// Request-scoped cancellation flag. The caller owns it and keeps it alive for the
// duration of the request; providers poll it while a call is in flight.
class CancellationToken {
 public:
  CancellationToken() = default;

  CancellationToken(const CancellationToken &) = delete;
  CancellationToken &operator=(const CancellationToken &) = delete;

  void cancel() noexcept {
    cancelled_.store(true, std::memory_order_release);
  }

  bool is_cancelled() const noexcept {
    return cancelled_.load(std::memory_order_acquire);
  }

 private:
  std::atomic<bool> cancelled_{false};
};

}  // namespace faq_core
