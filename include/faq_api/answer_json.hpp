#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "faq_core/corpus_index.hpp"
#include "faq_core/services/retrieval_service.hpp"
#include "faq_core/types.hpp"

namespace faq_api {

// Status code plus JSON body, independent of the HTTP framework serving it.
struct JsonReply {
  int status_code = 200;
  nlohmann::json body;
};

// Response body for POST /faq. match_question is present only when a match was found.
nlohmann::json answer_to_json(const faq_core::AnswerResult &result);

// HTTP status for an answer: 400 for invalid input, 200 for everything else.
int status_code_for(const faq_core::AnswerResult &result);

nlohmann::json index_stats_to_json(const faq_core::CorpusIndex &index);

// Body of GET /.
nlohmann::json health_to_json(const faq_core::CorpusIndex &index);

nlohmann::json error_to_json(const std::string &error);

/**
 * @brief Reads the question out of a POST /faq body.
 *
 * Strings are taken as they are; numbers and booleans become their JSON text.
 * A missing or null field, an array, an object, or a body that is not an object
 * all give an empty question, which the service rejects as invalid input.
 */
std::string question_from_body(const nlohmann::json &body);

// Full POST /faq exchange: malformed JSON is a 400, everything else goes through the service.
JsonReply faq_reply(const faq_core::RetrievalService &service, const std::string &request_body);

}  // namespace faq_api
