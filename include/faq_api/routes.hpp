#pragma once
#include <crow.h>

#include <memory>
#include <nlohmann/json.hpp>

#include "faq_api/request_tracker.hpp"

namespace faq_core {
class RetrievalService;
}  // namespace faq_core

namespace faq_api {

class Routes {
 public:
  // /faq requests are admitted through `tracker` so shutdown can drain them
  Routes(std::shared_ptr<faq_core::RetrievalService> retrieval_service, RequestTracker &tracker);

  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  void register_routes(crow::SimpleApp &app);

 private:
  std::shared_ptr<faq_core::RetrievalService> retrieval_service_;
  RequestTracker &tracker_;

  crow::response handle_health_check(const crow::request &req);
  crow::response handle_faq(const crow::request &req);

  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
};

}  // namespace faq_api
