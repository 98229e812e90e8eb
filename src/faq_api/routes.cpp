#include "faq_api/routes.hpp"

#include <iostream>
#include <utility>

#include "faq_api/answer_json.hpp"
#include "faq_core/services/retrieval_service.hpp"

namespace faq_api {
Routes::Routes(std::shared_ptr<faq_core::RetrievalService> retrieval_service,
               RequestTracker &tracker)
    : retrieval_service_(std::move(retrieval_service)), tracker_(tracker) {}

void Routes::register_routes(crow::SimpleApp &app) {
  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/faq").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_faq(req);
  });

  std::cout << "Registered GET / and POST /faq" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request &) {
  return create_json_response(health_to_json(retrieval_service_->index()));
}

crow::response Routes::handle_faq(const crow::request &req) {
  RequestTracker::Scope scope(tracker_);
  if (!scope.admitted()) {
    return create_json_response(error_to_json("Server is shutting down"), 503);
  }
  JsonReply reply = faq_reply(*retrieval_service_, req.body);
  return create_json_response(reply.body, reply.status_code);
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

}  // namespace faq_api
