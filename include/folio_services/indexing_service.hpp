#pragma once

#include <folio_core/chunking/segmenter.hpp>
#include <folio_core/db/chunk_store.hpp>
#include <folio_core/llm/embedding_provider.hpp>
#include <folio_core/retrieval/keyword_index.hpp>
#include <folio_core/vector/vector_index.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace folio_services {

struct IndexingStats {
  std::string document_id;
  std::string class_level;
  size_t total_pages = 0;
  size_t total_chunks = 0;
  size_t total_images = 0;
  size_t total_tables = 0;
  size_t total_embeddings = 0;
  std::vector<folio_core::DroppedMedia> dropped_media;
};

class IndexingService {
 public:
  static constexpr size_t EMBEDDING_BATCH_SIZE = 64;

  IndexingService(std::shared_ptr<folio_core::ChunkStore> chunk_store,
                  std::shared_ptr<folio_core::VectorIndex> vector_index,
                  std::shared_ptr<folio_core::KeywordIndex> keyword_index,
                  std::shared_ptr<folio_core::EmbeddingProvider> embedder,
                  folio_core::ChunkingConfig chunking_config = {});

  // Chunk, embed and store one document. A document id that is already
  // indexed is replaced.
  IndexingStats index_document(const std::vector<folio_core::PageRecord> &pages,
                               const std::string &document_id,
                               const std::string &class_level);

  // Returns the number of chunks removed.
  size_t delete_document(const std::string &document_id);

  void rebuild_keyword_index();

  // Reloads the in-memory indexes from the chunk store. Called on startup.
  void restore_indexes();

 private:
  void remove_from_indexes(const std::vector<std::string> &chunk_ids);

  std::shared_ptr<folio_core::ChunkStore> chunk_store_;
  std::shared_ptr<folio_core::VectorIndex> vector_index_;
  std::shared_ptr<folio_core::KeywordIndex> keyword_index_;
  std::shared_ptr<folio_core::EmbeddingProvider> embedder_;
  folio_core::Segmenter segmenter_;
  // Serializes writers; readers go straight to the indexes
  std::mutex write_mutex_;
};

}  // namespace folio_services
