#pragma once
#include <crow.h>

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <string>

#include "faq_api/request_tracker.hpp"
#include "faq_api/routes.hpp"

namespace faq_core {
class RetrievalService;
}  // namespace faq_core

namespace faq_api {

/**
 * @class Server
 * @brief The FAQ HTTP API: a Crow app with its routes, served from a background thread.
 *
 * Crow's own signal handling is disabled; the owner decides when to call stop().
 */
class Server {
 public:
  Server(const std::string &host, std::uint16_t port,
         std::shared_ptr<faq_core::RetrievalService> retrieval_service);
  ~Server();

  // crow::SimpleApp can be neither copied nor moved
  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;
  Server(Server &&) = delete;
  Server &operator=(Server &&) = delete;

  void start();

  /**
   * @brief Stops serving.
   *
   * New /faq requests get a 503 straight away. Requests already answering get up to
   * `drain_timeout` to finish before the listener and its worker threads are shut down.
   */
  void stop(std::chrono::seconds drain_timeout);

  bool is_running() const {
    return running_;
  }

  std::size_t requests_in_flight() const {
    return tracker_.in_flight();
  }

 private:
  crow::SimpleApp app_;
  std::string host_;
  std::uint16_t port_;
  RequestTracker tracker_;
  Routes routes_;
  std::future<void> run_future_;
  bool running_ = false;
};

}  // namespace faq_api
