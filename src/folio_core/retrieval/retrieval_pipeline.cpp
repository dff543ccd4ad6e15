#include "folio_core/retrieval/retrieval_pipeline.hpp"

#include <iostream>
#include <unordered_set>

namespace folio_core {

namespace {

std::vector<RetrievalResult> renumbered(std::vector<RetrievalResult> results) {
  for (size_t i = 0; i < results.size(); ++i) {
    results[i].rank = static_cast<int>(i) + 1;
  }
  return results;
}

}  // namespace

RetrievalPipeline::RetrievalPipeline(std::shared_ptr<HybridRetriever> retriever, QueryClassifier classifier)
    : retriever_(std::move(retriever)), classifier_(std::move(classifier)) {}

std::vector<RetrievalResult> RetrievalPipeline::search(const std::string& query,
                                                       int top_k,
                                                       const ChunkFilter& filters) const {
  if (top_k <= 0) {
    return {};
  }

  const QueryIntent intent = classifier_.classify(query);
  std::cout << "Query intent: " << to_string(intent) << std::endl;

  if (intent == QueryIntent::Example) {
    const auto range = classifier_.extract_example_range(query);
    if (range) {
      auto results = search_example_range(query, *range, top_k, filters);
      if (!results.empty()) {
        return renumbered(std::move(results));
      }
    }
    const auto number = classifier_.extract_example_number(query);
    if (number) {
      auto results = retriever_->retrieve_by_example(query, *number, top_k, filters);
      if (!results.empty()) {
        return renumbered(std::move(results));
      }
      std::cout << "No chunk labelled example " << *number << ", using general retrieval" << std::endl;
    }
    // A named example that no chunk carries falls back to general retrieval
    if (range || number) {
      return renumbered(retriever_->retrieve(query, top_k, filters));
    }
  }

  switch (intent) {
    case QueryIntent::Definition:
      return search_by_kind(query, ContentKind::Definition, top_k, filters);
    case QueryIntent::Theorem:
      return search_by_kind(query, ContentKind::Theorem, top_k, filters);
    case QueryIntent::Formula:
      return search_by_kind(query, ContentKind::Formula, top_k, filters);
    case QueryIntent::Example:
      return search_by_kind(query, ContentKind::Example, top_k, filters);
    case QueryIntent::Exercise:
    case QueryIntent::Concept:
      break;
  }
  return renumbered(retriever_->retrieve(query, top_k, filters));
}

std::vector<RetrievalResult> RetrievalPipeline::search_example_range(
    const std::string& query,
    const std::vector<std::string>& numbers,
    int top_k,
    const ChunkFilter& filters) const {
  const int per_number_k = retriever_->config().per_number_k;
  std::vector<RetrievalResult> results;
  std::unordered_set<std::string> seen;
  for (const auto& number : numbers) {
    for (auto& result : retriever_->retrieve_by_example(query, number, per_number_k, filters)) {
      if (seen.insert(result.chunk.chunk_id).second) {
        results.push_back(std::move(result));
      }
    }
  }
  if (results.size() > static_cast<size_t>(top_k)) {
    results.resize(static_cast<size_t>(top_k));
  }
  return results;
}

std::vector<RetrievalResult> RetrievalPipeline::search_by_kind(const std::string& query,
                                                               ContentKind kind,
                                                               int top_k,
                                                               const ChunkFilter& filters) const {
  auto results = retriever_->retrieve_by_type(query, kind, top_k, filters);

  // Low yield: back-fill with general results after the typed ones
  if (results.size() < static_cast<size_t>(top_k / 2)) {
    std::unordered_set<std::string> seen;
    for (const auto& result : results) {
      seen.insert(result.chunk.chunk_id);
    }
    for (auto& result : retriever_->retrieve(query, top_k, filters)) {
      if (results.size() >= static_cast<size_t>(top_k)) {
        break;
      }
      if (seen.insert(result.chunk.chunk_id).second) {
        results.push_back(std::move(result));
      }
    }
  }
  return renumbered(std::move(results));
}

}  // namespace folio_core
