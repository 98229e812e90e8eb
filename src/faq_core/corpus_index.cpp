#include "faq_core/corpus_index.hpp"

#include <algorithm>
#include <future>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace faq_core {

namespace {

// Never throws EmbeddingUnavailableError; failures become the empty marker.
std::vector<float> embed_or_empty(EmbeddingProvider &provider, const CorpusEntry &entry,
                                  size_t position) {
  try {
    std::vector<float> vector = provider.get_embedding(CorpusIndex::embedding_text(entry));
    if (!is_finite_embedding(vector)) {
      std::cerr << "Warning: corpus entry " << position << " (\"" << entry.question
                << "\") embedded with non-finite values. Treating it as unavailable." << std::endl;
      return {};
    }
    return vector;
  } catch (const EmbeddingUnavailableError &e) {
    std::cerr << "Warning: could not embed corpus entry " << position << " (\"" << entry.question
              << "\"): " << e.what() << std::endl;
    return {};
  }
}

}  // namespace

CorpusIndex::CorpusIndex(std::vector<IndexedEntry> entries, size_t dimension)
    : entries_(std::move(entries)), dimension_(dimension) {}

std::string CorpusIndex::embedding_text(const CorpusEntry &entry) {
  return "Question: " + entry.question + "\nAnswer: " + entry.answer;
}

CorpusIndex CorpusIndex::build(const std::vector<CorpusEntry> &entries,
                               EmbeddingProvider &provider, size_t parallelism) {
  if (parallelism == 0) {
    throw std::invalid_argument("CorpusIndex build parallelism must be at least 1.");
  }

  std::cout << "Building corpus index for " << entries.size() << " entries with "
            << parallelism << " concurrent embedding call(s)..." << std::endl;

  std::vector<std::vector<float>> vectors(entries.size());
  if (parallelism == 1) {
    for (size_t i = 0; i < entries.size(); ++i) {
      vectors[i] = embed_or_empty(provider, entries[i], i);
    }
  } else {
    // Batches of at most `parallelism` calls; each future writes only its own slot.
    for (size_t batch_start = 0; batch_start < entries.size(); batch_start += parallelism) {
      size_t batch_end = std::min(entries.size(), batch_start + parallelism);
      std::vector<std::future<std::vector<float>>> batch;
      batch.reserve(batch_end - batch_start);
      for (size_t i = batch_start; i < batch_end; ++i) {
        batch.push_back(std::async(std::launch::async, [&provider, &entries, i] {
          return embed_or_empty(provider, entries[i], i);
        }));
      }
      for (size_t i = batch_start; i < batch_end; ++i) {
        vectors[i] = batch[i - batch_start].get();
      }
    }
  }

  size_t dimension = 0;
  for (const auto &vector : vectors) {
    if (!vector.empty()) {
      dimension = vector.size();
      break;
    }
  }

  std::vector<IndexedEntry> indexed;
  indexed.reserve(entries.size());
  for (size_t i = 0; i < entries.size(); ++i) {
    std::vector<float> vector = std::move(vectors[i]);
    if (!vector.empty() && vector.size() != dimension) {
      std::cerr << "Warning: corpus entry " << i << " embedded with " << vector.size()
                << " dimensions, expected " << dimension << ". Treating it as unavailable."
                << std::endl;
      vector.clear();
    }
    indexed.push_back(IndexedEntry{entries[i], std::move(vector)});
  }

  CorpusIndex index(std::move(indexed), dimension);
  std::cout << "Corpus index ready: " << index.embedded_count() << "/" << index.size()
            << " entries embedded, dimension " << index.dimension() << "." << std::endl;
  return index;
}

size_t CorpusIndex::embedded_count() const {
  return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
                                           [](const IndexedEntry &e) { return !e.vector.empty(); }));
}

}  // namespace faq_core
