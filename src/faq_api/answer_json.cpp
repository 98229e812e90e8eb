#include "faq_api/answer_json.hpp"

#include <cmath>
#include <iostream>

namespace faq_api {
namespace {

double round_score(double score) {
  return std::round(score * 1000.0) / 1000.0;
}

}  // namespace

nlohmann::json answer_to_json(const faq_core::AnswerResult &result) {
  nlohmann::json response;
  response["status"] = faq_core::to_string(result.status);
  if (result.status == faq_core::AnswerStatus::InvalidInput) {
    response["error"] = result.text;
    return response;
  }
  response["answer"] = result.text;
  response["match_score"] = round_score(result.score);
  if (result.matched_question.has_value()) {
    response["match_question"] = *result.matched_question;
  }
  return response;
}

int status_code_for(const faq_core::AnswerResult &result) {
  return result.status == faq_core::AnswerStatus::InvalidInput ? 400 : 200;
}

nlohmann::json index_stats_to_json(const faq_core::CorpusIndex &index) {
  nlohmann::json stats;
  stats["entries"] = index.size();
  stats["embedded"] = index.embedded_count();
  stats["dimension"] = index.dimension();
  return stats;
}

nlohmann::json health_to_json(const faq_core::CorpusIndex &index) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = "FAQ bot API is running";
  response["status"] = "healthy";
  response["index"] = index_stats_to_json(index);
  return response;
}

nlohmann::json error_to_json(const std::string &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

std::string question_from_body(const nlohmann::json &body) {
  if (!body.is_object()) {
    return "";
  }
  auto field = body.find("question");
  if (field == body.end()) {
    return "";
  }
  if (field->is_string()) {
    return field->get<std::string>();
  }
  if (field->is_number() || field->is_boolean()) {
    return field->dump();
  }
  return "";
}

JsonReply faq_reply(const faq_core::RetrievalService &service, const std::string &request_body) {
  nlohmann::json body = nlohmann::json::parse(request_body, nullptr, false);
  if (body.is_discarded()) {
    std::cerr << "Rejected /faq request with a malformed JSON body" << std::endl;
    return {400, error_to_json("Invalid JSON body")};
  }

  std::string question = question_from_body(body);
  std::cout << "FAQ question: " << question << std::endl;
  faq_core::AnswerResult result = service.answer(question);
  std::cout << "FAQ result: " << faq_core::to_string(result.status) << " (score " << result.score
            << ")" << std::endl;
  return {status_code_for(result), answer_to_json(result)};
}

}  // namespace faq_api
