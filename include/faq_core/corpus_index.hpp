#pragma once

#include <string>
#include <vector>

#include "faq_core/llm/embedding_provider.hpp"
#include "faq_core/types.hpp"

namespace faq_core {

/**
 * @class CorpusIndex
 * @brief The FAQ corpus paired with one precomputed embedding per entry.
 *
 * Built once at startup and read-only afterwards, so any number of request threads may
 * read it without locking. Entries keep corpus order. Every vector either has
 * dimension() elements or is empty, the marker for an entry that could not be embedded.
 */
class CorpusIndex {
 public:
  CorpusIndex() = default;

  /**
   * @brief Embeds every entry and returns the finished index.
   *
   * A provider failure for one entry leaves that entry with an empty vector; it never
   * aborts the build. The dimension is fixed by the first successful embedding in
   * corpus order, and vectors of any other length or holding inf/NaN are discarded as
   * malformed.
   *
   * @param entries The corpus, in its canonical order.
   * @param provider Embedding provider, called once per entry with no retries.
   * @param parallelism Maximum number of embedding calls in flight at once.
   */
  static CorpusIndex build(const std::vector<CorpusEntry> &entries, EmbeddingProvider &provider,
                           size_t parallelism = 1);

  // Text sent to the embedding provider for an entry.
  static std::string embedding_text(const CorpusEntry &entry);

  const std::vector<IndexedEntry> &entries() const {
    return entries_;
  }
  size_t size() const {
    return entries_.size();
  }
  bool empty() const {
    return entries_.empty();
  }
  size_t dimension() const {
    return dimension_;
  }
  size_t embedded_count() const;

 private:
  CorpusIndex(std::vector<IndexedEntry> entries, size_t dimension);

  std::vector<IndexedEntry> entries_;
  size_t dimension_ = 0;
};

}  // namespace faq_core
