#pragma once

#include <memory>
#include <string>
#include <vector>

#include "folio_core/retrieval/hybrid_retriever.hpp"
#include "folio_core/retrieval/query_classifier.hpp"

namespace folio_core {

/**
 * @brief Classifier-driven retrieval.
 *
 * Example ranges and example numbers are looked up by exact metadata match;
 * definition, theorem, formula and example queries are restricted to chunks
 * of that kind and back-filled with general results when the restricted search
 * yields fewer than half of the requested results.
 */
class RetrievalPipeline {
 public:
  RetrievalPipeline(std::shared_ptr<HybridRetriever> retriever, QueryClassifier classifier = QueryClassifier());

  // Ranks in the result are 1..n
  std::vector<RetrievalResult> search(const std::string& query,
                                      int top_k,
                                      const ChunkFilter& filters = {}) const;

  const QueryClassifier& classifier() const {
    return classifier_;
  }

 private:
  std::vector<RetrievalResult> search_example_range(const std::string& query,
                                                    const std::vector<std::string>& numbers,
                                                    int top_k,
                                                    const ChunkFilter& filters) const;
  std::vector<RetrievalResult> search_by_kind(const std::string& query,
                                              ContentKind kind,
                                              int top_k,
                                              const ChunkFilter& filters) const;

  std::shared_ptr<HybridRetriever> retriever_;
  QueryClassifier classifier_;
};

}  // namespace folio_core
