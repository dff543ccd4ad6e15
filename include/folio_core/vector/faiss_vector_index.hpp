#pragma once

#include <faiss/IndexIDMap.h>

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "folio_core/vector/vector_index.hpp"

namespace folio_core {

/**
 * @brief Cosine-similarity index over chunk embeddings.
 *
 * Vectors are L2-normalized and stored in an IndexFlatIP wrapped by
 * IndexIDMap2, so inner product equals cosine similarity. Chunk ids map to
 * sequential faiss labels.
 */
class FaissVectorIndex : public VectorIndex {
 public:
  explicit FaissVectorIndex(int dimension);
  ~FaissVectorIndex() override = default;

  // FaissVectorIndex is non-copyable and non-movable to keep the index stable
  FaissVectorIndex(const FaissVectorIndex&) = delete;
  FaissVectorIndex& operator=(const FaissVectorIndex&) = delete;
  FaissVectorIndex(FaissVectorIndex&&) = delete;
  FaissVectorIndex& operator=(FaissVectorIndex&&) = delete;

  void add(const std::vector<std::vector<float>>& vectors, const std::vector<std::string>& ids) override;
  std::vector<ScoredId> search(const std::vector<float>& query, int k) const override;
  std::vector<ScoredId> search_filtered(const std::vector<float>& query,
                                        int k,
                                        const std::vector<std::string>& allowed_ids) const override;
  void remove(const std::vector<std::string>& ids) override;
  size_t size() const override;

  int dimension() const {
    return dimension_;
  }

 private:
  std::vector<float> normalized(const std::vector<float>& vector) const;
  void remove_locked(const std::vector<std::string>& ids);
  std::vector<ScoredId> search_index(faiss::Index& index,
                                     const std::vector<float>& query,
                                     int k,
                                     const std::vector<faiss::idx_t>* label_map) const;

  int dimension_;
  std::unique_ptr<faiss::IndexIDMap2> index_;
  std::unordered_map<std::string, faiss::idx_t> label_by_id_;
  std::unordered_map<faiss::idx_t, std::string> id_by_label_;
  // Normalized copies, used to build the temporary index for filtered search
  std::unordered_map<faiss::idx_t, std::vector<float>> vectors_;
  faiss::idx_t next_label_ = 0;
  mutable std::mutex mutex_;
};

}  // namespace folio_core
