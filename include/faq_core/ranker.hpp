#pragma once

#include <vector>

#include "faq_core/corpus_index.hpp"
#include "faq_core/types.hpp"

namespace faq_core {

// Cosine similarity in [-1, 1]. Returns 0.0 when either vector is empty, either norm is
// zero, the lengths differ, or a non-finite component makes the ratio undefined.
double cosine_similarity(const std::vector<float> &a, const std::vector<float> &b);

// Scores every indexed entry against the query, highest first. Equal scores keep corpus order.
std::vector<ScoredEntry> rank(const std::vector<float> &query_vector, const CorpusIndex &index);

}  // namespace faq_core
