#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "folio_core/types/chunk.hpp"

namespace folio_core {

class KeywordIndex {
 public:
  virtual ~KeywordIndex() = default;

  // Replaces the whole index with the given chunks.
  virtual void index(const std::vector<Chunk>& chunks) = 0;

  // Up to k (chunk id, score) pairs with score > 0, best first.
  virtual std::vector<ScoredId> search(const std::string& query, int k) const = 0;

  virtual size_t size() const = 0;
};

/**
 * @brief Okapi BM25 over chunk text.
 *
 * Rebuilds construct a fresh snapshot and swap it in under the mutex, so a
 * concurrent search runs against either the old or the new snapshot.
 */
class Bm25KeywordIndex : public KeywordIndex {
 public:
  static constexpr double K1 = 1.5;
  static constexpr double B = 0.75;
  static constexpr double EPSILON = 0.25;

  Bm25KeywordIndex() = default;

  // Disable copy constructor and assignment
  Bm25KeywordIndex(const Bm25KeywordIndex&) = delete;
  Bm25KeywordIndex& operator=(const Bm25KeywordIndex&) = delete;

  void index(const std::vector<Chunk>& chunks) override;
  std::vector<ScoredId> search(const std::string& query, int k) const override;
  size_t size() const override;

  // Lower-cased, split on whitespace. Used for documents and queries alike.
  static std::vector<std::string> tokenize(const std::string& text);

 private:
  struct Snapshot {
    std::vector<std::string> chunk_ids;
    std::vector<std::unordered_map<std::string, int>> term_frequencies;
    std::vector<size_t> document_lengths;
    std::unordered_map<std::string, double> idf;
    double average_document_length = 0.0;
  };

  static std::shared_ptr<const Snapshot> build_snapshot(const std::vector<Chunk>& chunks);
  std::shared_ptr<const Snapshot> current() const;

  mutable std::mutex mutex_;
  std::shared_ptr<const Snapshot> snapshot_;
};

}  // namespace folio_core
