#include "folio_core/vector/faiss_vector_index.hpp"

#include <faiss/IndexFlat.h>
#include <faiss/impl/FaissException.h>
#include <faiss/impl/IDSelector.h>
#include <faiss/utils/distances.h>

#include <algorithm>
#include <unordered_set>

namespace folio_core {

FaissVectorIndex::FaissVectorIndex(int dimension) : dimension_(dimension) {
  if (dimension_ <= 0) {
    throw VectorIndexError("Vector dimension must be positive, got " + std::to_string(dimension_));
  }
  auto base_index = new faiss::IndexFlatIP(dimension_);
  // Wrap with IDMap2 to enable add_with_ids and remove_ids; the wrapper owns the base index
  index_ = std::make_unique<faiss::IndexIDMap2>(base_index);
  index_->own_fields = true;
}

std::vector<float> FaissVectorIndex::normalized(const std::vector<float>& vector) const {
  if (vector.size() != static_cast<size_t>(dimension_)) {
    throw VectorIndexError("Vector dimension mismatch. Expected " + std::to_string(dimension_) +
                           ", got " + std::to_string(vector.size()));
  }
  std::vector<float> copy = vector;
  faiss::fvec_renorm_L2(static_cast<size_t>(dimension_), 1, copy.data());
  return copy;
}

void FaissVectorIndex::add(const std::vector<std::vector<float>>& vectors,
                           const std::vector<std::string>& ids) {
  if (vectors.size() != ids.size()) {
    throw VectorIndexError("Vector/id count mismatch: " + std::to_string(vectors.size()) +
                           " vectors, " + std::to_string(ids.size()) + " ids");
  }
  if (vectors.empty()) {
    return;
  }

  std::vector<float> flat;
  flat.reserve(vectors.size() * static_cast<size_t>(dimension_));
  std::vector<std::vector<float>> normalized_vectors;
  normalized_vectors.reserve(vectors.size());
  for (const auto& vector : vectors) {
    normalized_vectors.push_back(normalized(vector));
    flat.insert(flat.end(), normalized_vectors.back().begin(), normalized_vectors.back().end());
  }

  std::lock_guard<std::mutex> lock(mutex_);
  remove_locked(ids);

  std::vector<faiss::idx_t> labels;
  labels.reserve(ids.size());
  for (size_t i = 0; i < ids.size(); ++i) {
    labels.push_back(next_label_++);
  }

  try {
    index_->add_with_ids(static_cast<faiss::idx_t>(ids.size()), flat.data(), labels.data());
  } catch (const faiss::FaissException& e) {
    throw VectorIndexError("Failed to add vectors: " + std::string(e.what()));
  }

  for (size_t i = 0; i < ids.size(); ++i) {
    label_by_id_[ids[i]] = labels[i];
    id_by_label_[labels[i]] = ids[i];
    vectors_[labels[i]] = std::move(normalized_vectors[i]);
  }
}

std::vector<ScoredId> FaissVectorIndex::search_index(faiss::Index& index,
                                                     const std::vector<float>& query,
                                                     int k,
                                                     const std::vector<faiss::idx_t>* label_map) const {
  const int actual_k = std::min<int>(k, static_cast<int>(index.ntotal));
  if (actual_k <= 0) {
    return {};
  }

  std::vector<float> distances(actual_k);
  std::vector<faiss::idx_t> labels(actual_k);
  try {
    index.search(1, query.data(), actual_k, distances.data(), labels.data());
  } catch (const faiss::FaissException& e) {
    throw VectorIndexError("Vector search failed: " + std::string(e.what()));
  }

  std::vector<ScoredId> hits;
  for (int i = 0; i < actual_k; ++i) {
    if (labels[i] < 0) {
      continue;
    }
    const faiss::idx_t label = label_map ? (*label_map)[static_cast<size_t>(labels[i])] : labels[i];
    const auto it = id_by_label_.find(label);
    if (it != id_by_label_.end()) {
      hits.push_back({it->second, static_cast<double>(distances[i])});
    }
  }
  return hits;
}

std::vector<ScoredId> FaissVectorIndex::search(const std::vector<float>& query, int k) const {
  const auto normalized_query = normalized(query);
  std::lock_guard<std::mutex> lock(mutex_);
  if (index_->ntotal == 0 || k <= 0) {
    return {};
  }
  return search_index(*index_, normalized_query, k, nullptr);
}

std::vector<ScoredId> FaissVectorIndex::search_filtered(const std::vector<float>& query,
                                                        int k,
                                                        const std::vector<std::string>& allowed_ids) const {
  const auto normalized_query = normalized(query);
  std::lock_guard<std::mutex> lock(mutex_);
  if (k <= 0) {
    return {};
  }

  // Temporary index over the allowed subset; position i holds label_map[i]
  std::vector<faiss::idx_t> label_map;
  std::vector<float> flat;
  std::unordered_set<faiss::idx_t> seen;
  for (const auto& id : allowed_ids) {
    const auto it = label_by_id_.find(id);
    if (it == label_by_id_.end()) {
      continue;
    }
    if (!seen.insert(it->second).second) {
      continue;
    }
    const auto& vector = vectors_.at(it->second);
    label_map.push_back(it->second);
    flat.insert(flat.end(), vector.begin(), vector.end());
  }
  if (label_map.empty()) {
    return {};
  }

  faiss::IndexFlatIP subset_index(dimension_);
  try {
    subset_index.add(static_cast<faiss::idx_t>(label_map.size()), flat.data());
  } catch (const faiss::FaissException& e) {
    throw VectorIndexError("Failed to build filtered index: " + std::string(e.what()));
  }
  return search_index(subset_index, normalized_query, k, &label_map);
}

void FaissVectorIndex::remove(const std::vector<std::string>& ids) {
  std::lock_guard<std::mutex> lock(mutex_);
  remove_locked(ids);
}

void FaissVectorIndex::remove_locked(const std::vector<std::string>& ids) {
  std::vector<faiss::idx_t> labels;
  for (const auto& id : ids) {
    const auto it = label_by_id_.find(id);
    if (it != label_by_id_.end()) {
      labels.push_back(it->second);
    }
  }
  if (labels.empty()) {
    return;
  }

  try {
    faiss::IDSelectorBatch selector(labels.size(), labels.data());
    index_->remove_ids(selector);
  } catch (const faiss::FaissException& e) {
    throw VectorIndexError("Failed to remove vectors: " + std::string(e.what()));
  }

  for (const auto label : labels) {
    label_by_id_.erase(id_by_label_[label]);
    id_by_label_.erase(label);
    vectors_.erase(label);
  }
}

size_t FaissVectorIndex::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<size_t>(index_->ntotal);
}

}  // namespace folio_core
