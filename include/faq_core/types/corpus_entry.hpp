#pragma once

#include <string>
#include <vector>

namespace faq_core {

struct CorpusEntry {
  std::string question;
  std::string answer;
};

// One entry plus its embedding. An empty vector marks an entry the provider could not embed.
struct IndexedEntry {
  CorpusEntry entry;
  std::vector<float> vector;
};

struct ScoredEntry {
  CorpusEntry entry;
  double score;
  size_t position;  // index in the corpus
};

}  // namespace faq_core
