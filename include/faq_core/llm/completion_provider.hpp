#pragma once

#include <stdexcept>
#include <string>

#include "faq_core/cancellation_token.hpp"

namespace faq_core {

class CompletionUnavailableError : public std::exception {
 public:
  explicit CompletionUnavailableError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class CompletionCancelledError : public std::exception {
 public:
  const char *what() const noexcept override {
    return "Completion cancelled";
  }
};

/**
 * Turns a prompt into generated text.
 *
 * Throws CompletionUnavailableError when the model cannot be reached or answers with an
 * unusable payload, and CompletionCancelledError when `cancel` fires mid-generation.
 */
class CompletionProvider {
 public:
  virtual ~CompletionProvider() = default;

  virtual std::string complete(const std::string &prompt, const CancellationToken &cancel) = 0;
};

}  // namespace faq_core
