#include "faq_core/corpus_loader.hpp"

#include <fstream>

namespace faq_core {
namespace {

std::string required_string(const nlohmann::json &item, const char *key, size_t position) {
  if (!item.contains(key) || !item.at(key).is_string()) {
    throw CorpusError("Corpus entry " + std::to_string(position) + " is missing string field '" +
                      key + "'");
  }
  return item.at(key).get<std::string>();
}

}  // namespace

std::vector<CorpusEntry> load_corpus(const std::filesystem::path &path) {
  std::ifstream file_stream(path);
  if (!file_stream.is_open()) {
    throw CorpusError("Failed to open corpus file: " + path.string());
  }

  nlohmann::json corpus_json;
  try {
    file_stream >> corpus_json;
  } catch (const nlohmann::json::exception &e) {
    throw CorpusError("Failed to parse JSON in corpus file '" + path.string() + "': " + e.what());
  }

  return parse_corpus(corpus_json);
}

std::vector<CorpusEntry> parse_corpus(const nlohmann::json &corpus_json) {
  if (!corpus_json.is_array()) {
    throw CorpusError("Corpus must be a JSON array of question/answer objects");
  }

  std::vector<CorpusEntry> entries;
  entries.reserve(corpus_json.size());
  for (size_t i = 0; i < corpus_json.size(); ++i) {
    const auto &item = corpus_json[i];
    if (!item.is_object()) {
      throw CorpusError("Corpus entry " + std::to_string(i) + " is not an object");
    }
    CorpusEntry entry;
    entry.question = required_string(item, "question", i);
    entry.answer = required_string(item, "answer", i);
    entries.push_back(std::move(entry));
  }
  return entries;
}

}  // namespace faq_core
