#pragma once

// Aggregator header for commonly-used core types.
// Instead of including each individual header (e.g. faq_core/types/corpus_entry.hpp),
// users can simply do `#include "faq_core/types.hpp"`.
//
#include "faq_core/types/answer_result.hpp"
#include "faq_core/types/corpus_entry.hpp"
