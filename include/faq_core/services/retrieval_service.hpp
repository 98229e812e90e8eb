#pragma once

#include <memory>
#include <string>

#include "faq_core/cancellation_token.hpp"
#include "faq_core/corpus_index.hpp"
#include "faq_core/llm/completion_provider.hpp"
#include "faq_core/llm/embedding_provider.hpp"
#include "faq_core/services/answer_composer.hpp"
#include "faq_core/types.hpp"

namespace faq_core {

/**
 * @class RetrievalService
 * @brief Answers a free-text question from the FAQ corpus.
 *
 * Owns the immutable CorpusIndex. answer() is safe to call from several threads at once
 * provided the providers are, and it never throws for provider failures: every outcome
 * is an AnswerResult whose status says what happened.
 */
class RetrievalService {
 public:
  RetrievalService(CorpusIndex index, std::shared_ptr<EmbeddingProvider> embedding_provider,
                   std::shared_ptr<CompletionProvider> completion_provider,
                   ComposerOptions options = {});

  // Disable copy constructor and assignment
  RetrievalService(const RetrievalService &) = delete;
  RetrievalService &operator=(const RetrievalService &) = delete;

  AnswerResult answer(const std::string &query) const;
  AnswerResult answer(const std::string &query, const CancellationToken &cancel) const;

  const CorpusIndex &index() const {
    return index_;
  }

 private:
  CorpusIndex index_;
  std::shared_ptr<EmbeddingProvider> embedding_provider_;
  AnswerComposer composer_;
};

}  // namespace faq_core
