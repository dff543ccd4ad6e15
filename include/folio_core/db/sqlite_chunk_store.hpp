#pragma once

#include <string>
#include <vector>

#include "folio_core/db/chunk_store.hpp"
#include "folio_core/db/database_manager.hpp"

namespace folio_core {

/**
 * @brief ChunkStore over the pooled SQLite database.
 *
 * Chunk text is stored zstd-compressed; equations, media and the page span
 * are stored as a JSON payload. Every method borrows its own connection, so
 * the store can be shared between threads.
 */
class SqliteChunkStore : public ChunkStore {
 public:
  explicit SqliteChunkStore(DatabaseManager& db_manager);

  // Disable copy constructor and assignment
  SqliteChunkStore(const SqliteChunkStore&) = delete;
  SqliteChunkStore& operator=(const SqliteChunkStore&) = delete;

  void put(const std::vector<Chunk>& chunks) override;
  std::optional<Chunk> get(const std::string& chunk_id) const override;
  std::vector<Chunk> filter(const ChunkFilter& filter) const override;
  std::vector<std::string> delete_by_document(const std::string& document_id) override;
  std::vector<DocumentSummary> list_documents() const override;
  void put_embeddings(const std::vector<std::string>& chunk_ids,
                      const std::vector<std::vector<float>>& embeddings) override;
  std::vector<std::pair<std::string, std::vector<float>>> embeddings() const override;

 private:
  DatabaseManager& db_manager_;
};

}  // namespace folio_core
