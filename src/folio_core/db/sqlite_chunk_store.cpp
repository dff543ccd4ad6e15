#include "folio_core/db/sqlite_chunk_store.hpp"

#include <cstring>
#include <iostream>
#include <memory>

#include <nlohmann/json.hpp>

#include "folio_core/db/pooled_connection.hpp"
#include "folio_core/db/sqlite_error_utils.hpp"
#include "folio_core/db/transaction.hpp"
#include "folio_core/serialization/chunk_json.hpp"
#include "folio_core/services/compression_service.hpp"

namespace folio_core {

namespace {

const char* const CHUNK_COLUMNS =
    "id, document_id, class_level, sequence, chapter_number, chapter_name, section_name, "
    "content_kind, page_number, label, part_index, part_count, char_count, token_count, "
    "math_density, content, media_json";

// Receives one row selected with CHUNK_COLUMNS
struct ChunkRowReader {
  std::vector<Chunk>& out;

  void operator()(std::string id,
                  std::string document_id,
                  std::string class_level,
                  int sequence,
                  int chapter_number,
                  std::string chapter_name,
                  std::string section_name,
                  std::string content_kind,
                  int page_number,
                  std::unique_ptr<std::string> label,
                  int part_index,
                  int part_count,
                  sqlite_int64 char_count,
                  sqlite_int64 token_count,
                  double math_density,
                  std::vector<char> content,
                  std::string media_json) const {
    Chunk chunk;
    chunk.chunk_id = std::move(id);
    chunk.document_id = std::move(document_id);
    chunk.class_level = std::move(class_level);
    chunk.sequence = sequence;
    chunk.context.chapter_number = chapter_number;
    chunk.context.chapter_name = std::move(chapter_name);
    chunk.context.section_name = std::move(section_name);
    chunk.content_kind = content_kind_from_string(content_kind);
    chunk.page_number = page_number;
    if (label) {
      chunk.label = *label;
    }
    chunk.part_index = part_index;
    chunk.part_count = part_count;
    chunk.char_count = static_cast<size_t>(char_count);
    chunk.token_count = static_cast<size_t>(token_count);
    chunk.math_density = math_density;
    chunk.text_content = CompressionService::decompress(content);

    const auto media = nlohmann::json::parse(media_json, nullptr, false);
    if (media.is_discarded()) {
      std::cerr << "Warning: Unreadable media payload for chunk " << chunk.chunk_id << std::endl;
    } else {
      chunk_payload_from_json(media, chunk);
    }
    out.push_back(std::move(chunk));
  }
};

std::vector<char> to_blob(const std::vector<float>& vector) {
  std::vector<char> blob(vector.size() * sizeof(float));
  std::memcpy(blob.data(), vector.data(), blob.size());
  return blob;
}

std::vector<float> from_blob(const std::vector<char>& blob) {
  std::vector<float> vector(blob.size() / sizeof(float));
  std::memcpy(vector.data(), blob.data(), vector.size() * sizeof(float));
  return vector;
}

}  // namespace

SqliteChunkStore::SqliteChunkStore(DatabaseManager& db_manager) : db_manager_(db_manager) {}

void SqliteChunkStore::put(const std::vector<Chunk>& chunks) {
  if (chunks.empty()) {
    return;
  }

  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, /*immediate*/ true);
    for (const auto& chunk : chunks) {
      std::unique_ptr<std::string> label;
      if (chunk.label) {
        label = std::make_unique<std::string>(*chunk.label);
      }
      *conn << "INSERT INTO chunks (id, document_id, class_level, sequence, chapter_number, "
               "chapter_name, section_name, content_kind, page_number, label, part_index, "
               "part_count, char_count, token_count, math_density, content, media_json) "
               "VALUES (?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?) "
               "ON CONFLICT(id) DO UPDATE SET document_id=excluded.document_id, "
               "class_level=excluded.class_level, sequence=excluded.sequence, "
               "chapter_number=excluded.chapter_number, chapter_name=excluded.chapter_name, "
               "section_name=excluded.section_name, content_kind=excluded.content_kind, "
               "page_number=excluded.page_number, label=excluded.label, "
               "part_index=excluded.part_index, part_count=excluded.part_count, "
               "char_count=excluded.char_count, token_count=excluded.token_count, "
               "math_density=excluded.math_density, content=excluded.content, "
               "media_json=excluded.media_json"
            << chunk.chunk_id << chunk.document_id << chunk.class_level << chunk.sequence
            << chunk.context.chapter_number << chunk.context.chapter_name
            << chunk.context.section_name << to_string(chunk.content_kind) << chunk.page_number
            << label << chunk.part_index << chunk.part_count
            << static_cast<sqlite_int64>(chunk.char_count) << static_cast<sqlite_int64>(chunk.token_count)
            << chunk.math_density << CompressionService::compress(chunk.text_content)
            << chunk_payload_to_json(chunk).dump();
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception& e) {
    throw ChunkStoreError(format_db_error("put chunks", e));
  }
}

std::optional<Chunk> SqliteChunkStore::get(const std::string& chunk_id) const {
  std::vector<Chunk> found;
  try {
    PooledConnection conn(db_manager_);
    *conn << std::string("SELECT ") + CHUNK_COLUMNS + " FROM chunks WHERE id = ?" << chunk_id >>
        ChunkRowReader{found};
  } catch (const sqlite::sqlite_exception& e) {
    throw ChunkStoreError(format_db_error("get chunk", e));
  }
  if (found.empty()) {
    return std::nullopt;
  }
  return std::move(found.front());
}

std::vector<Chunk> SqliteChunkStore::filter(const ChunkFilter& filter) const {
  std::string sql = std::string("SELECT ") + CHUNK_COLUMNS + " FROM chunks WHERE 1=1";
  if (filter.document_id) sql += " AND document_id = ?";
  if (filter.class_level) sql += " AND class_level = ?";
  if (filter.chapter_number) sql += " AND chapter_number = ?";
  if (filter.content_kind) sql += " AND content_kind = ?";
  if (filter.label) sql += " AND label = ?";
  sql += " ORDER BY document_id, sequence";

  std::vector<Chunk> chunks;
  try {
    PooledConnection conn(db_manager_);
    auto query = *conn << sql;
    if (filter.document_id) query << *filter.document_id;
    if (filter.class_level) query << *filter.class_level;
    if (filter.chapter_number) query << *filter.chapter_number;
    if (filter.content_kind) query << to_string(*filter.content_kind);
    if (filter.label) query << *filter.label;
    query >> ChunkRowReader{chunks};
  } catch (const sqlite::sqlite_exception& e) {
    throw ChunkStoreError(format_db_error("filter chunks", e));
  }
  return chunks;
}

std::vector<std::string> SqliteChunkStore::delete_by_document(const std::string& document_id) {
  std::vector<std::string> removed;
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, true);
    *conn << "SELECT id FROM chunks WHERE document_id = ? ORDER BY sequence" << document_id >>
        [&](std::string id) { removed.push_back(std::move(id)); };
    *conn << "DELETE FROM chunks WHERE document_id = ?" << document_id;
    tx.commit();
  } catch (const sqlite::sqlite_exception& e) {
    throw ChunkStoreError(format_db_error("delete document " + document_id, e));
  }
  return removed;
}

std::vector<DocumentSummary> SqliteChunkStore::list_documents() const {
  std::vector<DocumentSummary> documents;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT document_id, MIN(class_level), COUNT(*) FROM chunks "
             "GROUP BY document_id ORDER BY document_id" >>
        [&](std::string document_id, std::string class_level, sqlite_int64 total) {
          DocumentSummary summary;
          summary.document_id = std::move(document_id);
          summary.class_level = std::move(class_level);
          summary.total_chunks = static_cast<size_t>(total);
          documents.push_back(std::move(summary));
        };

    for (auto& summary : documents) {
      *conn << "SELECT chapter_number, MIN(chapter_name) FROM chunks WHERE document_id = ? "
               "GROUP BY chapter_number ORDER BY chapter_number"
            << summary.document_id >>
          [&](int number, std::string name) {
            summary.chapters.push_back("Chapter " + std::to_string(number) + ": " + name);
          };
    }
  } catch (const sqlite::sqlite_exception& e) {
    throw ChunkStoreError(format_db_error("list documents", e));
  }
  return documents;
}

void SqliteChunkStore::put_embeddings(const std::vector<std::string>& chunk_ids,
                                      const std::vector<std::vector<float>>& embeddings) {
  if (chunk_ids.size() != embeddings.size()) {
    throw ChunkStoreError("put embeddings: " + std::to_string(chunk_ids.size()) + " ids but " +
                          std::to_string(embeddings.size()) + " embeddings");
  }
  if (chunk_ids.empty()) {
    return;
  }

  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, true);
    for (size_t i = 0; i < chunk_ids.size(); ++i) {
      *conn << "UPDATE chunks SET vector_blob = ? WHERE id = ?" << to_blob(embeddings[i])
            << chunk_ids[i];
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception& e) {
    throw ChunkStoreError(format_db_error("put embeddings", e));
  }
}

std::vector<std::pair<std::string, std::vector<float>>> SqliteChunkStore::embeddings() const {
  std::vector<std::pair<std::string, std::vector<float>>> stored;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, vector_blob FROM chunks WHERE vector_blob IS NOT NULL "
             "ORDER BY document_id, sequence" >>
        [&](std::string id, std::vector<char> blob) {
          stored.emplace_back(std::move(id), from_blob(blob));
        };
  } catch (const sqlite::sqlite_exception& e) {
    throw ChunkStoreError(format_db_error("load embeddings", e));
  }
  return stored;
}

}  // namespace folio_core
