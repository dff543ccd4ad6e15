#include "folio_core/retrieval/keyword_index.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <sstream>

namespace folio_core {

std::vector<std::string> Bm25KeywordIndex::tokenize(const std::string& text) {
  std::string lowered = text;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  std::vector<std::string> tokens;
  std::istringstream stream(lowered);
  std::string token;
  while (stream >> token) {
    tokens.push_back(token);
  }
  return tokens;
}

std::shared_ptr<const Bm25KeywordIndex::Snapshot> Bm25KeywordIndex::build_snapshot(
    const std::vector<Chunk>& chunks) {
  auto snapshot = std::make_shared<Snapshot>();
  snapshot->chunk_ids.reserve(chunks.size());
  snapshot->term_frequencies.reserve(chunks.size());
  snapshot->document_lengths.reserve(chunks.size());

  std::unordered_map<std::string, int> document_frequencies;
  size_t total_length = 0;
  for (const auto& chunk : chunks) {
    const auto tokens = tokenize(chunk.text_content);
    std::unordered_map<std::string, int> frequencies;
    for (const auto& token : tokens) {
      frequencies[token]++;
    }
    for (const auto& entry : frequencies) {
      document_frequencies[entry.first]++;
    }
    snapshot->chunk_ids.push_back(chunk.chunk_id);
    snapshot->term_frequencies.push_back(std::move(frequencies));
    snapshot->document_lengths.push_back(tokens.size());
    total_length += tokens.size();
  }

  if (chunks.empty()) {
    return snapshot;
  }

  const double n = static_cast<double>(chunks.size());
  snapshot->average_document_length = static_cast<double>(total_length) / n;

  // Terms present in more than half of the documents get a negative idf;
  // those are floored to a small fraction of the average idf instead.
  double idf_sum = 0.0;
  std::vector<std::string> negative_terms;
  for (const auto& [term, df] : document_frequencies) {
    const double idf = std::log(n - df + 0.5) - std::log(df + 0.5);
    snapshot->idf[term] = idf;
    idf_sum += idf;
    if (idf < 0) {
      negative_terms.push_back(term);
    }
  }
  const double average_idf = idf_sum / static_cast<double>(snapshot->idf.size());
  const double floor = EPSILON * average_idf;
  for (const auto& term : negative_terms) {
    snapshot->idf[term] = floor;
  }
  return snapshot;
}

void Bm25KeywordIndex::index(const std::vector<Chunk>& chunks) {
  auto snapshot = build_snapshot(chunks);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot_ = std::move(snapshot);
  }
  std::cout << "Keyword index rebuilt with " << chunks.size() << " chunks" << std::endl;
}

std::shared_ptr<const Bm25KeywordIndex::Snapshot> Bm25KeywordIndex::current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return snapshot_;
}

size_t Bm25KeywordIndex::size() const {
  auto snapshot = current();
  return snapshot ? snapshot->chunk_ids.size() : 0;
}

std::vector<ScoredId> Bm25KeywordIndex::search(const std::string& query, int k) const {
  auto snapshot = current();
  if (!snapshot || snapshot->chunk_ids.empty() || k <= 0) {
    return {};
  }

  const auto query_tokens = tokenize(query);
  const size_t n = snapshot->chunk_ids.size();
  std::vector<double> scores(n, 0.0);
  for (const auto& term : query_tokens) {
    const auto idf_it = snapshot->idf.find(term);
    if (idf_it == snapshot->idf.end()) {
      continue;
    }
    for (size_t i = 0; i < n; ++i) {
      const auto tf_it = snapshot->term_frequencies[i].find(term);
      if (tf_it == snapshot->term_frequencies[i].end()) {
        continue;
      }
      const double tf = tf_it->second;
      const double length_ratio =
          static_cast<double>(snapshot->document_lengths[i]) / snapshot->average_document_length;
      scores[i] += idf_it->second * (tf * (K1 + 1)) / (tf + K1 * (1 - B + B * length_ratio));
    }
  }

  std::vector<size_t> order;
  for (size_t i = 0; i < n; ++i) {
    if (scores[i] > 0) {
      order.push_back(i);
    }
  }
  // Ties keep index order
  std::stable_sort(order.begin(), order.end(),
                   [&scores](size_t a, size_t b) { return scores[a] > scores[b]; });
  if (order.size() > static_cast<size_t>(k)) {
    order.resize(static_cast<size_t>(k));
  }

  std::vector<ScoredId> results;
  results.reserve(order.size());
  for (size_t i : order) {
    results.push_back({snapshot->chunk_ids[i], scores[i]});
  }
  return results;
}

}  // namespace folio_core
