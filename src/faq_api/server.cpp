#include "faq_api/server.hpp"

#include <iostream>
#include <utility>

namespace faq_api {

Server::Server(const std::string &host, std::uint16_t port,
               std::shared_ptr<faq_core::RetrievalService> retrieval_service)
    : host_(host), port_(port), routes_(std::move(retrieval_service), tracker_) {
  routes_.register_routes(app_);
  app_.signal_clear();
}

Server::~Server() {
  stop(std::chrono::seconds(0));
}

void Server::start() {
  if (running_) {
    return;
  }
  running_ = true;
  run_future_ = std::async(std::launch::async, [this] {
    app_.port(port_).bindaddr(host_).multithreaded().run();
  });
  std::cout << "Listening on " << host_ << ":" << port_ << std::endl;
}

void Server::stop(std::chrono::seconds drain_timeout) {
  if (!running_) {
    return;
  }
  tracker_.close();
  std::size_t pending = tracker_.in_flight();
  if (pending > 0) {
    std::cout << "Waiting up to " << drain_timeout.count() << "s for " << pending
              << " in-flight request(s)..." << std::endl;
  }
  if (!tracker_.wait_idle(drain_timeout)) {
    std::cerr << "Warning: " << tracker_.in_flight()
              << " request(s) still running after the drain timeout." << std::endl;
  }

  app_.stop();
  if (run_future_.valid()) {
    try {
      run_future_.get();
    } catch (const std::exception &e) {
      std::cerr << "API server thread ended with an error: " << e.what() << std::endl;
    }
  }
  running_ = false;
}

}  // namespace faq_api
