#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "faq_core/types.hpp"

namespace faq_core {

class CorpusError : public std::exception {
 public:
  explicit CorpusError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Reads a JSON array of {"question": ..., "answer": ...} objects, preserving order.
std::vector<CorpusEntry> load_corpus(const std::filesystem::path &path);

std::vector<CorpusEntry> parse_corpus(const nlohmann::json &corpus_json);

}  // namespace faq_core
