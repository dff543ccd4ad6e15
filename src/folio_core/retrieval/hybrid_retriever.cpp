#include "folio_core/retrieval/hybrid_retriever.hpp"

#include <algorithm>
#include <future>
#include <iostream>
#include <unordered_map>
#include <unordered_set>

#include "folio_core/retrieval/query_classifier.hpp"

namespace folio_core {

namespace {

constexpr size_t RELATED_QUERY_BYTES = 500;

// Cuts at most max_bytes without splitting a UTF-8 sequence
std::string utf8_prefix(const std::string& text, size_t max_bytes) {
  if (text.size() <= max_bytes) {
    return text;
  }
  size_t end = max_bytes;
  while (end > 0 && (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) {
    --end;
  }
  return text.substr(0, end);
}

}  // namespace

HybridRetriever::HybridRetriever(std::shared_ptr<ChunkStore> store,
                                 std::shared_ptr<VectorIndex> vector_index,
                                 std::shared_ptr<KeywordIndex> keyword_index,
                                 std::shared_ptr<EmbeddingProvider> embedder,
                                 RetrievalConfig config)
    : store_(std::move(store)),
      vector_index_(std::move(vector_index)),
      keyword_index_(std::move(keyword_index)),
      embedder_(std::move(embedder)),
      config_(config) {}

double HybridRetriever::select_alpha(const std::string& query) const {
  if (QueryClassifier::is_entity_query(query)) {
    std::cout << "Entity query detected, favouring keyword ranking (alpha=" << config_.entity_alpha
              << ")" << std::endl;
    return config_.entity_alpha;
  }
  return config_.default_alpha;
}

std::vector<ScoredId> HybridRetriever::fuse(const std::vector<ScoredId>& vector_hits,
                                            const std::vector<ScoredId>& lexical_hits,
                                            double alpha,
                                            double rank_constant) {
  std::vector<ScoredId> fused;
  std::unordered_map<std::string, size_t> position;

  auto accumulate = [&](const std::vector<ScoredId>& hits, double weight) {
    std::unordered_set<std::string> seen_in_list;
    int rank = 0;
    for (const auto& hit : hits) {
      if (!seen_in_list.insert(hit.id).second) {
        continue;
      }
      ++rank;
      const double contribution = weight / (rank_constant + rank);
      const auto it = position.find(hit.id);
      if (it == position.end()) {
        position.emplace(hit.id, fused.size());
        fused.push_back({hit.id, contribution});
      } else {
        fused[it->second].score += contribution;
      }
    }
  };
  accumulate(vector_hits, alpha);
  accumulate(lexical_hits, 1.0 - alpha);

  std::stable_sort(fused.begin(), fused.end(),
                   [](const ScoredId& a, const ScoredId& b) { return a.score > b.score; });
  return fused;
}

std::vector<ScoredId> HybridRetriever::vector_search(
    const std::string& query,
    int candidates,
    const std::optional<std::vector<std::string>>& allowed_ids) const {
  if (vector_index_->size() == 0) {
    return {};
  }
  const std::vector<float> query_embedding = embedder_->get_embedding(query);
  if (allowed_ids) {
    return vector_index_->search_filtered(query_embedding, candidates, *allowed_ids);
  }
  return vector_index_->search(query_embedding, candidates);
}

std::vector<RetrievalResult> HybridRetriever::retrieve(const std::string& query,
                                                       std::optional<int> top_k,
                                                       const ChunkFilter& filters) const {
  const int k = top_k.value_or(config_.top_k);
  if (k <= 0) {
    return {};
  }
  const double alpha = select_alpha(query);
  const int candidates = k * std::max(config_.candidate_multiplier, 1);

  std::optional<std::vector<std::string>> allowed_ids;
  std::unordered_set<std::string> allowed_set;
  if (!filters.empty()) {
    allowed_ids.emplace();
    for (const auto& chunk : store_->filter(filters)) {
      allowed_ids->push_back(chunk.chunk_id);
      allowed_set.insert(chunk.chunk_id);
    }
    if (allowed_ids->empty()) {
      return {};
    }
  }

  auto vector_future = std::async(std::launch::async, [this, &query, candidates, &allowed_ids]() {
    return vector_search(query, candidates, allowed_ids);
  });
  auto lexical_future = std::async(std::launch::async, [this, &query, candidates, &filters]() {
    // With a filter, rank the whole corpus so filtering does not starve the candidate list
    const int lexical_k = filters.empty()
                              ? candidates
                              : static_cast<int>(std::max<size_t>(keyword_index_->size(), 1));
    return keyword_index_->search(query, lexical_k);
  });

  std::vector<ScoredId> vector_hits = vector_future.get();
  std::vector<ScoredId> lexical_hits = lexical_future.get();

  if (!filters.empty()) {
    lexical_hits.erase(std::remove_if(lexical_hits.begin(), lexical_hits.end(),
                                      [&allowed_set](const ScoredId& hit) {
                                        return allowed_set.count(hit.id) == 0;
                                      }),
                       lexical_hits.end());
    if (lexical_hits.size() > static_cast<size_t>(candidates)) {
      lexical_hits.resize(static_cast<size_t>(candidates));
    }
  }

  const auto fused = fuse(vector_hits, lexical_hits, alpha, config_.rank_constant);

  std::vector<RetrievalResult> results;
  for (const auto& hit : fused) {
    if (results.size() >= static_cast<size_t>(k)) {
      break;
    }
    auto chunk = store_->get(hit.id);
    if (!chunk) {
      std::cerr << "Warning: Skipping stale chunk id " << hit.id << " during retrieval" << std::endl;
      continue;
    }
    RetrievalResult result;
    result.chunk = std::move(*chunk);
    result.score = hit.score;
    result.rank = static_cast<int>(results.size()) + 1;
    results.push_back(std::move(result));
  }
  return results;
}

std::vector<RetrievalResult> HybridRetriever::retrieve_by_type(const std::string& query,
                                                               ContentKind kind,
                                                               int top_k,
                                                               const ChunkFilter& filters) const {
  ChunkFilter typed = filters;
  typed.content_kind = kind;
  return retrieve(query, top_k, typed);
}

std::vector<RetrievalResult> HybridRetriever::retrieve_by_example(const std::string& query,
                                                                  const std::string& example_number,
                                                                  int top_k,
                                                                  const ChunkFilter& filters) const {
  ChunkFilter example = filters;
  example.content_kind = ContentKind::Example;
  example.label = example_number;
  return retrieve(query, top_k, example);
}

std::vector<RetrievalResult> HybridRetriever::retrieve_from_chapter(const std::string& query,
                                                                    const std::string& class_level,
                                                                    int chapter_number,
                                                                    int top_k) const {
  ChunkFilter chapter;
  chapter.class_level = class_level;
  chapter.chapter_number = chapter_number;
  return retrieve(query, top_k, chapter);
}

std::vector<RetrievalResult> HybridRetriever::get_related_chunks(const std::string& chunk_id,
                                                                 int top_k) const {
  const auto reference = store_->get(chunk_id);
  if (!reference || top_k <= 0) {
    return {};
  }

  auto results = retrieve(utf8_prefix(reference->text_content, RELATED_QUERY_BYTES), top_k + 1);
  results.erase(std::remove_if(results.begin(), results.end(),
                               [&chunk_id](const RetrievalResult& r) {
                                 return r.chunk.chunk_id == chunk_id;
                               }),
                results.end());
  if (results.size() > static_cast<size_t>(top_k)) {
    results.resize(static_cast<size_t>(top_k));
  }
  for (size_t i = 0; i < results.size(); ++i) {
    results[i].rank = static_cast<int>(i) + 1;
  }
  return results;
}

}  // namespace folio_core
