#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "folio_core/retrieval/chunk_filter.hpp"
#include "folio_core/types/chunk.hpp"

namespace folio_core {

class ChunkStoreError : public std::exception {
 public:
  explicit ChunkStoreError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct DocumentSummary {
  std::string document_id;
  std::string class_level;
  size_t total_chunks = 0;
  // "Chapter 3: Trigonometric Functions", in chapter order
  std::vector<std::string> chapters;
};

class ChunkStore {
 public:
  virtual ~ChunkStore() = default;

  // Inserts or replaces by chunk id.
  virtual void put(const std::vector<Chunk>& chunks) = 0;

  virtual std::optional<Chunk> get(const std::string& chunk_id) const = 0;

  // Chunks matching the filter, in document then sequence order. An empty
  // filter returns every chunk.
  virtual std::vector<Chunk> filter(const ChunkFilter& filter) const = 0;

  // Returns the ids that were removed.
  virtual std::vector<std::string> delete_by_document(const std::string& document_id) = 0;

  virtual std::vector<DocumentSummary> list_documents() const = 0;

  // Embeddings are kept beside their chunks so the vector index can be rebuilt
  // on startup. Ids the store does not know are ignored.
  virtual void put_embeddings(const std::vector<std::string>& chunk_ids,
                              const std::vector<std::vector<float>>& embeddings) = 0;

  // Every stored (chunk id, embedding) pair, in document then sequence order.
  virtual std::vector<std::pair<std::string, std::vector<float>>> embeddings() const = 0;
};

}  // namespace folio_core
