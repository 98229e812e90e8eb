#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace faq_api {

/**
 * @class RequestTracker
 * @brief Counts in-flight requests so shutdown can wait for them to finish.
 *
 * Once close() is called no new request is admitted; wait_idle() then blocks
 * until the requests already admitted have left or the timeout runs out.
 */
class RequestTracker {
 public:
  /**
   * @brief Admission for one request, released when it goes out of scope.
   *
   * Check admitted() before doing any work; a scope created after close()
   * is not admitted and does not count.
   */
  class Scope {
   public:
    explicit Scope(RequestTracker &tracker) : tracker_(tracker), admitted_(tracker.try_enter()) {}
    ~Scope() {
      if (admitted_) {
        tracker_.leave();
      }
    }

    Scope(const Scope &) = delete;
    Scope &operator=(const Scope &) = delete;

    bool admitted() const {
      return admitted_;
    }

   private:
    RequestTracker &tracker_;
    bool admitted_;
  };

  RequestTracker() = default;

  RequestTracker(const RequestTracker &) = delete;
  RequestTracker &operator=(const RequestTracker &) = delete;

  // False once the tracker is closed.
  bool try_enter();
  void leave();

  // Stops admitting new requests. Does not block.
  void close();

  // True if the tracker drained before the timeout.
  bool wait_idle(std::chrono::milliseconds timeout);

  std::size_t in_flight() const;
  bool is_closed() const;

 private:
  mutable std::mutex mutex_;
  std::condition_variable idle_cv_;
  std::size_t in_flight_ = 0;
  bool closed_ = false;
};

}  // namespace faq_api
