#pragma once

#include <optional>
#include <string>

namespace faq_core {

enum class AnswerStatus {
  Answered,
  NoConfidentMatch,
  InvalidInput,
  EmbeddingUnavailable,
  CompletionUnavailable,
  Cancelled
};

std::string to_string(AnswerStatus status);

struct AnswerResult {
  std::string text;
  std::optional<std::string> matched_question;
  double score = 0.0;
  AnswerStatus status = AnswerStatus::NoConfidentMatch;
};

}  // namespace faq_core
