#pragma once

#include <memory>
#include <string>
#include <vector>

#include "faq_core/cancellation_token.hpp"
#include "faq_core/llm/completion_provider.hpp"
#include "faq_core/types.hpp"

namespace faq_core {

struct ComposerOptions {
  // Top scores below this are reported as NoConfidentMatch. A tunable policy value.
  double confidence_threshold = 0.5;
  std::string no_match_message =
      "I could not find a close match. Please rephrase or ask a team member.";
};

class AnswerComposer {
 public:
  AnswerComposer(std::shared_ptr<CompletionProvider> completion_provider,
                 ComposerOptions options = {});

  /**
   * @brief Turns a ranked list into the final answer.
   *
   * Uses the top entry as grounding context when its score reaches the confidence
   * threshold, otherwise returns the no-match message. A completion failure still
   * reports the matched question and its score.
   */
  AnswerResult compose(const std::string &query, const std::vector<ScoredEntry> &ranked,
                       const CancellationToken &cancel) const;

  // Fallback result for a request that could not be ranked or matched.
  AnswerResult no_match(double score, AnswerStatus status) const;

  static std::string build_prompt(const std::string &query, const std::string &context_answer);

  const ComposerOptions &options() const {
    return options_;
  }

 private:
  std::shared_ptr<CompletionProvider> completion_provider_;
  ComposerOptions options_;
};

}  // namespace faq_core
