#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "folio_core/config.hpp"
#include "folio_core/db/chunk_store.hpp"
#include "folio_core/llm/embedding_provider.hpp"
#include "folio_core/retrieval/chunk_filter.hpp"
#include "folio_core/retrieval/keyword_index.hpp"
#include "folio_core/vector/vector_index.hpp"

namespace folio_core {

/**
 * @brief Fuses vector and BM25 rankings with weighted reciprocal rank fusion.
 *
 * Both searches run concurrently and fetch top_k * candidate_multiplier
 * candidates. Fused ids are resolved through the ChunkStore; ids the store no
 * longer knows are skipped.
 */
class HybridRetriever {
 public:
  HybridRetriever(std::shared_ptr<ChunkStore> store,
                  std::shared_ptr<VectorIndex> vector_index,
                  std::shared_ptr<KeywordIndex> keyword_index,
                  std::shared_ptr<EmbeddingProvider> embedder,
                  RetrievalConfig config = {});

  // Disable copy constructor and assignment
  HybridRetriever(const HybridRetriever&) = delete;
  HybridRetriever& operator=(const HybridRetriever&) = delete;

  // top_k defaults to the configured value
  std::vector<RetrievalResult> retrieve(const std::string& query,
                                        std::optional<int> top_k = std::nullopt,
                                        const ChunkFilter& filters = {}) const;

  std::vector<RetrievalResult> retrieve_by_type(const std::string& query,
                                                ContentKind kind,
                                                int top_k,
                                                const ChunkFilter& filters = {}) const;

  // Exact match on the example number of example chunks
  std::vector<RetrievalResult> retrieve_by_example(const std::string& query,
                                                   const std::string& example_number,
                                                   int top_k,
                                                   const ChunkFilter& filters = {}) const;

  std::vector<RetrievalResult> retrieve_from_chapter(const std::string& query,
                                                     const std::string& class_level,
                                                     int chapter_number,
                                                     int top_k) const;

  // Chunks similar to the given one, which is never part of the result. An
  // unknown id yields an empty result.
  std::vector<RetrievalResult> get_related_chunks(const std::string& chunk_id, int top_k) const;

  // Vector weight for the query: entity_alpha when it names an
  // example/exercise number, default_alpha otherwise.
  double select_alpha(const std::string& query) const;

  /**
   * @brief Weighted reciprocal rank fusion.
   *
   * Each list contributes weight / (rank_constant + rank) with 1-based ranks;
   * the vector list is weighted alpha, the lexical list 1 - alpha. The result
   * is sorted by fused score, ties kept in first-seen order (vector list
   * first).
   */
  static std::vector<ScoredId> fuse(const std::vector<ScoredId>& vector_hits,
                                    const std::vector<ScoredId>& lexical_hits,
                                    double alpha,
                                    double rank_constant);

  const RetrievalConfig& config() const {
    return config_;
  }

 private:
  std::vector<ScoredId> vector_search(const std::string& query,
                                      int candidates,
                                      const std::optional<std::vector<std::string>>& allowed_ids) const;

  std::shared_ptr<ChunkStore> store_;
  std::shared_ptr<VectorIndex> vector_index_;
  std::shared_ptr<KeywordIndex> keyword_index_;
  std::shared_ptr<EmbeddingProvider> embedder_;
  RetrievalConfig config_;
};

}  // namespace folio_core
