#include "faq_core/services/retrieval_service.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

#include "faq_core/ranker.hpp"

namespace faq_core {
namespace {

constexpr const char *kWhitespace = " \t\n\r\f\v";
constexpr const char *kInvalidInputMessage = "Please send a question.";

std::string trim(const std::string &text) {
  size_t first = text.find_first_not_of(kWhitespace);
  if (first == std::string::npos) {
    return "";
  }
  size_t last = text.find_last_not_of(kWhitespace);
  return text.substr(first, last - first + 1);
}

AnswerResult cancelled_result() {
  AnswerResult result;
  result.text = "The request was cancelled.";
  result.status = AnswerStatus::Cancelled;
  return result;
}

}  // namespace

RetrievalService::RetrievalService(CorpusIndex index,
                                   std::shared_ptr<EmbeddingProvider> embedding_provider,
                                   std::shared_ptr<CompletionProvider> completion_provider,
                                   ComposerOptions options)
    : index_(std::move(index)),
      embedding_provider_(std::move(embedding_provider)),
      composer_(std::move(completion_provider), std::move(options)) {
  if (!embedding_provider_) {
    throw std::invalid_argument("RetrievalService requires an embedding provider");
  }
}

AnswerResult RetrievalService::answer(const std::string &query) const {
  CancellationToken never_cancelled;
  return answer(query, never_cancelled);
}

AnswerResult RetrievalService::answer(const std::string &query,
                                      const CancellationToken &cancel) const {
  const std::string question = trim(query);
  if (question.empty()) {
    AnswerResult result;
    result.text = kInvalidInputMessage;
    result.status = AnswerStatus::InvalidInput;
    return result;
  }

  if (cancel.is_cancelled()) {
    return cancelled_result();
  }

  std::vector<float> query_vector;
  try {
    query_vector = embedding_provider_->get_embedding(question);
  } catch (const EmbeddingUnavailableError &e) {
    std::cerr << "Query embedding unavailable: " << e.what() << std::endl;
    return composer_.no_match(0.0, AnswerStatus::EmbeddingUnavailable);
  }
  if (query_vector.empty() || !is_finite_embedding(query_vector)) {
    std::cerr << "Query embedding unavailable: provider returned an empty or non-finite vector"
              << std::endl;
    return composer_.no_match(0.0, AnswerStatus::EmbeddingUnavailable);
  }
  if (index_.dimension() != 0 && query_vector.size() != index_.dimension()) {
    std::cerr << "Warning: query embedded with " << query_vector.size()
              << " dimensions but the index uses " << index_.dimension() << std::endl;
  }

  if (cancel.is_cancelled()) {
    return cancelled_result();
  }

  std::vector<ScoredEntry> ranked = rank(query_vector, index_);
  return composer_.compose(question, ranked, cancel);
}

}  // namespace faq_core
