#include "folio_core/db/database_manager.hpp"

#include <iostream>
#include <stdexcept>

namespace folio_core {

DatabaseManager& DatabaseManager::get_instance() {
  static DatabaseManager instance;
  return instance;
}

void DatabaseManager::initialize(const std::filesystem::path& db_path, int pool_size) {
  if (is_initialized_) {
    return;
  }

  if (db_path.has_parent_path()) {
    std::filesystem::create_directories(db_path.parent_path());
  }

  // 1. Perform one-time schema setup before creating the pool
  setup_schema(db_path);

  // 2. Create the connection pool shared by the stores
  pool_ = std::make_unique<ConnectionPool>(db_path.string(), pool_size);

  is_initialized_ = true;
  std::cout << "Database ready at " << db_path.string() << " (" << pool_size << " connections)"
            << std::endl;
}

void DatabaseManager::shutdown() {
  if (!is_initialized_) {
    return;
  }
  pool_->shutdown();
  pool_.reset();
  is_initialized_ = false;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (!is_initialized_) {
    throw std::runtime_error("DatabaseManager has not been initialized.");
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (!is_initialized_) {
    return;
  }
  pool_->return_connection(std::move(conn));
}

void DatabaseManager::setup_schema(const std::filesystem::path& db_path) {
  // A single-use connection, so schema creation never competes with the pool
  sqlite::database db(db_path.string());
  db << "PRAGMA journal_mode = WAL;";

  db << R"(
      CREATE TABLE IF NOT EXISTS chunks (
          id TEXT PRIMARY KEY,
          document_id TEXT NOT NULL,
          class_level TEXT NOT NULL,
          sequence INTEGER NOT NULL,
          chapter_number INTEGER NOT NULL,
          chapter_name TEXT NOT NULL,
          section_name TEXT NOT NULL DEFAULT '',
          content_kind TEXT NOT NULL,
          page_number INTEGER NOT NULL,
          label TEXT,
          part_index INTEGER NOT NULL DEFAULT 1,
          part_count INTEGER NOT NULL DEFAULT 1,
          char_count INTEGER NOT NULL,
          token_count INTEGER NOT NULL,
          math_density REAL NOT NULL DEFAULT 0,
          content BLOB NOT NULL,
          media_json TEXT NOT NULL DEFAULT '{}',
          vector_blob BLOB
      )
    )";

  db << "CREATE INDEX IF NOT EXISTS idx_chunks_document ON chunks(document_id, sequence)";
  db << "CREATE INDEX IF NOT EXISTS idx_chunks_kind ON chunks(content_kind)";
  db << "CREATE INDEX IF NOT EXISTS idx_chunks_label ON chunks(label)";
}

}  // namespace folio_core
