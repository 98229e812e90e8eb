#include "faq_core/ranker.hpp"

#include <algorithm>
#include <cmath>

namespace faq_core {

double cosine_similarity(const std::vector<float> &a, const std::vector<float> &b) {
  if (a.empty() || b.empty() || a.size() != b.size()) {
    return 0.0;
  }

  double dot = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;
  for (size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * b[i];
    norm_a += static_cast<double>(a[i]) * a[i];
    norm_b += static_cast<double>(b[i]) * b[i];
  }

  if (norm_a == 0.0 || norm_b == 0.0) {
    return 0.0;
  }

  double score = dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
  // inf components give inf/inf; a NaN would also break the ranking's strict weak ordering
  if (!std::isfinite(score)) {
    return 0.0;
  }
  // Rounding can push |score| a hair past 1
  return std::clamp(score, -1.0, 1.0);
}

std::vector<ScoredEntry> rank(const std::vector<float> &query_vector, const CorpusIndex &index) {
  std::vector<ScoredEntry> scored;
  scored.reserve(index.size());

  const auto &entries = index.entries();
  for (size_t i = 0; i < entries.size(); ++i) {
    scored.push_back(ScoredEntry{entries[i].entry, cosine_similarity(query_vector, entries[i].vector), i});
  }

  std::stable_sort(scored.begin(), scored.end(), [](const ScoredEntry &lhs, const ScoredEntry &rhs) {
    return lhs.score > rhs.score;
  });
  return scored;
}

}  // namespace faq_core
