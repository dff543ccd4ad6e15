#include "folio_services/indexing_service.hpp"

#include <iostream>

namespace folio_services {

IndexingService::IndexingService(std::shared_ptr<folio_core::ChunkStore> chunk_store,
                                 std::shared_ptr<folio_core::VectorIndex> vector_index,
                                 std::shared_ptr<folio_core::KeywordIndex> keyword_index,
                                 std::shared_ptr<folio_core::EmbeddingProvider> embedder,
                                 folio_core::ChunkingConfig chunking_config)
    : chunk_store_(std::move(chunk_store)),
      vector_index_(std::move(vector_index)),
      keyword_index_(std::move(keyword_index)),
      embedder_(std::move(embedder)),
      segmenter_(chunking_config) {}

IndexingStats IndexingService::index_document(const std::vector<folio_core::PageRecord> &pages,
                                              const std::string &document_id,
                                              const std::string &class_level) {
  std::lock_guard<std::mutex> lock(write_mutex_);

  folio_core::ChunkingResult result = segmenter_.chunk_document(pages, document_id, class_level);

  IndexingStats stats;
  stats.document_id = document_id;
  stats.class_level = class_level;
  stats.total_pages = pages.size();
  stats.total_chunks = result.chunks.size();
  stats.dropped_media = result.diagnostics.dropped_media;
  for (const auto &chunk : result.chunks) {
    stats.total_images += chunk.images.size();
    stats.total_tables += chunk.tables.size();
  }

  // Embed before touching the stores, so a failing embedder leaves the
  // previous version of the document in place
  std::vector<std::string> ids;
  std::vector<std::vector<float>> embeddings;
  std::vector<std::string> batch;
  auto flush = [&]() {
    if (batch.empty()) {
      return;
    }
    for (auto &embedding : embedder_->get_embeddings(batch)) {
      embeddings.push_back(std::move(embedding));
    }
    batch.clear();
  };
  for (const auto &chunk : result.chunks) {
    ids.push_back(chunk.chunk_id);
    batch.push_back(chunk.full_context());
    if (batch.size() == EMBEDDING_BATCH_SIZE) {
      flush();
    }
  }
  flush();
  stats.total_embeddings = embeddings.size();

  // Re-indexing replaces whatever the document produced before
  remove_from_indexes(chunk_store_->delete_by_document(document_id));

  chunk_store_->put(result.chunks);
  if (!ids.empty()) {
    vector_index_->add(embeddings, ids);
    chunk_store_->put_embeddings(ids, embeddings);
  }
  keyword_index_->index(chunk_store_->filter({}));

  std::cout << "Indexed " << document_id << ": " << stats.total_chunks << " chunks from "
            << stats.total_pages << " pages, " << stats.total_embeddings << " embeddings" << std::endl;
  return stats;
}

size_t IndexingService::delete_document(const std::string &document_id) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  const auto removed = chunk_store_->delete_by_document(document_id);
  if (removed.empty()) {
    return 0;
  }
  remove_from_indexes(removed);
  keyword_index_->index(chunk_store_->filter({}));
  std::cout << "Deleted " << document_id << " (" << removed.size() << " chunks)" << std::endl;
  return removed.size();
}

void IndexingService::rebuild_keyword_index() {
  std::lock_guard<std::mutex> lock(write_mutex_);
  keyword_index_->index(chunk_store_->filter({}));
}

void IndexingService::restore_indexes() {
  std::lock_guard<std::mutex> lock(write_mutex_);

  std::vector<std::string> ids;
  std::vector<std::vector<float>> vectors;
  for (auto &[id, embedding] : chunk_store_->embeddings()) {
    if (embedding.size() != embedder_->dimension()) {
      std::cerr << "Warning: Skipping stored embedding of chunk " << id << " with dimension "
                << embedding.size() << std::endl;
      continue;
    }
    ids.push_back(std::move(id));
    vectors.push_back(std::move(embedding));
  }
  if (!ids.empty()) {
    vector_index_->add(vectors, ids);
  }
  std::cout << "Restored " << ids.size() << " vectors" << std::endl;

  keyword_index_->index(chunk_store_->filter({}));
}

void IndexingService::remove_from_indexes(const std::vector<std::string> &chunk_ids) {
  if (!chunk_ids.empty()) {
    vector_index_->remove(chunk_ids);
  }
}

}  // namespace folio_services
