#pragma once

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

namespace faq_core {

class EmbeddingUnavailableError : public std::exception {
 public:
  explicit EmbeddingUnavailableError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// False for vectors holding inf or NaN, which a provider must never hand to the ranker.
inline bool is_finite_embedding(const std::vector<float> &vector) {
  return std::all_of(vector.begin(), vector.end(), [](float value) { return std::isfinite(value); });
}

/**
 * Converts text into a fixed-length vector.
 *
 * Implementations must be safe to call from several threads at once and must throw
 * EmbeddingUnavailableError for any transport, timeout or payload failure.
 */
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  virtual std::vector<float> get_embedding(const std::string &text) = 0;
};

}  // namespace faq_core
