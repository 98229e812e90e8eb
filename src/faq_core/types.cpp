#include "faq_core/types.hpp"

namespace faq_core {

std::string to_string(AnswerStatus status) {
  switch (status) {
    case AnswerStatus::Answered:
      return "answered";
    case AnswerStatus::NoConfidentMatch:
      return "no_confident_match";
    case AnswerStatus::InvalidInput:
      return "invalid_input";
    case AnswerStatus::EmbeddingUnavailable:
      return "embedding_unavailable";
    case AnswerStatus::CompletionUnavailable:
      return "completion_unavailable";
    case AnswerStatus::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

}  // namespace faq_core
