#include "faq_core/services/answer_composer.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace faq_core {
namespace {

constexpr const char *kGroundingInstructions =
    R"(You are a helpful FAQ assistant. Treat the context answer below as trusted ground truth
and use it to respond to the user's question. If the context does not cover the question,
say that you are unsure and ask the user to rephrase.)";

constexpr const char *kCompletionUnavailableMessage =
    "I found a similar answer but could not reach the AI writer. Please try again later. "
    "Technical details: ";

constexpr const char *kCancelledMessage = "The request was cancelled before an answer was written.";

}  // namespace

AnswerComposer::AnswerComposer(std::shared_ptr<CompletionProvider> completion_provider,
                               ComposerOptions options)
    : completion_provider_(std::move(completion_provider)), options_(std::move(options)) {
  if (!completion_provider_) {
    throw std::invalid_argument("AnswerComposer requires a completion provider");
  }
}

std::string AnswerComposer::build_prompt(const std::string &query,
                                         const std::string &context_answer) {
  std::string prompt(kGroundingInstructions);
  prompt.append("\n\nContext answer: ");
  prompt.append(context_answer);
  prompt.append("\nUser question: ");
  prompt.append(query);
  prompt.append("\nRespond in 2-3 friendly sentences.");
  return prompt;
}

AnswerResult AnswerComposer::no_match(double score, AnswerStatus status) const {
  AnswerResult result;
  result.text = options_.no_match_message;
  result.score = score;
  result.status = status;
  return result;
}

AnswerResult AnswerComposer::compose(const std::string &query,
                                     const std::vector<ScoredEntry> &ranked,
                                     const CancellationToken &cancel) const {
  if (ranked.empty()) {
    return no_match(0.0, AnswerStatus::NoConfidentMatch);
  }

  const ScoredEntry &top = ranked.front();
  if (top.score < options_.confidence_threshold) {
    return no_match(top.score, AnswerStatus::NoConfidentMatch);
  }

  AnswerResult result;
  result.matched_question = top.entry.question;
  result.score = top.score;

  if (cancel.is_cancelled()) {
    result.text = kCancelledMessage;
    result.status = AnswerStatus::Cancelled;
    return result;
  }

  try {
    result.text = completion_provider_->complete(build_prompt(query, top.entry.answer), cancel);
    result.status = AnswerStatus::Answered;
  } catch (const CompletionUnavailableError &e) {
    std::cerr << "Completion unavailable for matched question \"" << top.entry.question
              << "\": " << e.what() << std::endl;
    result.text = kCompletionUnavailableMessage + std::string(e.what());
    result.status = AnswerStatus::CompletionUnavailable;
  } catch (const CompletionCancelledError &) {
    result.text = kCancelledMessage;
    result.status = AnswerStatus::Cancelled;
  }
  return result;
}

}  // namespace faq_core
