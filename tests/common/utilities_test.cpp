#include "utilities_test.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>

namespace folio_tests {

std::filesystem::path TestUtilities::create_temp_test_db() {
  static std::atomic<int> counter{0};
  auto temp_dir = std::filesystem::temp_directory_path() / "folio_tests";
  std::filesystem::create_directories(temp_dir);

  // Generate unique filename using timestamp
  auto now = std::chrono::system_clock::now();
  auto timestamp =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();

  return temp_dir / ("test_" + std::to_string(timestamp) + "_" + std::to_string(counter++) + ".db");
}

void TestUtilities::cleanup_temp_db(const std::filesystem::path& db_path) {
  // WAL mode leaves side files next to the database
  for (const std::string suffix : {"", "-wal", "-shm"}) {
    std::filesystem::path file = db_path.string() + suffix;
    if (std::filesystem::exists(file)) {
      std::filesystem::remove(file);
    }
  }

  // Also cleanup the parent directory if it's empty
  auto parent_dir = db_path.parent_path();
  if (std::filesystem::exists(parent_dir) && std::filesystem::is_empty(parent_dir)) {
    std::filesystem::remove(parent_dir);
  }
}

folio_core::PageRecord TestUtilities::create_test_page(int page_number,
                                                       const std::string& text,
                                                       std::vector<folio_core::PageImage> images,
                                                       std::vector<folio_core::PageTable> tables) {
  folio_core::PageRecord page;
  page.page_number = page_number;
  page.text = text;
  page.images = std::move(images);
  page.tables = std::move(tables);
  return page;
}

folio_core::PageImage TestUtilities::create_test_image(const std::string& image_id,
                                                       int page_number,
                                                       const std::string& caption) {
  folio_core::PageImage image;
  image.image_id = image_id;
  image.image_path = "images/" + image_id + ".png";
  image.caption = caption;
  image.page_number = page_number;
  return image;
}

folio_core::PageTable TestUtilities::create_test_table(const std::string& table_id,
                                                       int page_number,
                                                       const std::string& body) {
  folio_core::PageTable table;
  table.table_id = table_id;
  table.body = body;
  table.page_number = page_number;
  return table;
}

folio_core::Chunk TestUtilities::create_test_chunk(const std::string& chunk_id,
                                                   const std::string& text,
                                                   folio_core::ContentKind kind,
                                                   const std::string& document_id,
                                                   int sequence) {
  folio_core::Chunk chunk;
  chunk.chunk_id = chunk_id;
  chunk.document_id = document_id;
  chunk.class_level = "11";
  chunk.sequence = sequence;
  chunk.context.chapter_number = 1;
  chunk.context.chapter_name = "Sets";
  chunk.content_kind = kind;
  chunk.page_number = 1;
  chunk.page_numbers = {1};
  chunk.text_content = text;
  chunk.char_count = text.size();
  chunk.token_count = text.size() / 4;
  return chunk;
}

std::vector<folio_core::Chunk> TestUtilities::create_example_chunks(int count, const std::string& document_id) {
  std::vector<folio_core::Chunk> chunks;
  for (int i = 1; i <= count; ++i) {
    auto chunk = create_test_chunk(document_id + "_example_" + std::to_string(i),
                                   "EXAMPLE " + std::to_string(i) + "\nFind the value in case " +
                                       std::to_string(i) + ".",
                                   folio_core::ContentKind::Example, document_id, i);
    chunk.label = std::to_string(i);
    chunks.push_back(std::move(chunk));
  }
  return chunks;
}

std::string TestUtilities::create_paragraphs(size_t total_size, size_t paragraph_size, const std::string& word) {
  std::string text;
  std::string paragraph;
  while (text.size() < total_size) {
    if (!paragraph.empty()) {
      paragraph += ' ';
    }
    paragraph += word;
    if (paragraph.size() >= paragraph_size) {
      if (!text.empty()) {
        text += "\n\n";
      }
      text += paragraph;
      paragraph.clear();
    }
  }
  return text;
}

void InMemoryChunkStore::put(const std::vector<folio_core::Chunk>& chunks) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& chunk : chunks) {
    chunks_[chunk.chunk_id] = chunk;
  }
}

std::optional<folio_core::Chunk> InMemoryChunkStore::get(const std::string& chunk_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = chunks_.find(chunk_id);
  if (it == chunks_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<folio_core::Chunk> InMemoryChunkStore::filter(const folio_core::ChunkFilter& filter) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<folio_core::Chunk> matched;
  for (const auto& entry : chunks_) {
    if (filter.matches(entry.second)) {
      matched.push_back(entry.second);
    }
  }
  std::sort(matched.begin(), matched.end(), [](const folio_core::Chunk& a, const folio_core::Chunk& b) {
    return a.document_id != b.document_id ? a.document_id < b.document_id : a.sequence < b.sequence;
  });
  return matched;
}

std::vector<std::string> InMemoryChunkStore::delete_by_document(const std::string& document_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> removed;
  for (auto it = chunks_.begin(); it != chunks_.end();) {
    if (it->second.document_id == document_id) {
      removed.push_back(it->first);
      embeddings_.erase(it->first);
      it = chunks_.erase(it);
    } else {
      ++it;
    }
  }
  return removed;
}

std::vector<folio_core::DocumentSummary> InMemoryChunkStore::list_documents() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::map<std::string, folio_core::DocumentSummary> documents;
  for (const auto& entry : chunks_) {
    auto& summary = documents[entry.second.document_id];
    summary.document_id = entry.second.document_id;
    summary.class_level = entry.second.class_level;
    summary.total_chunks++;
  }
  std::vector<folio_core::DocumentSummary> list;
  for (auto& entry : documents) {
    list.push_back(std::move(entry.second));
  }
  return list;
}

void InMemoryChunkStore::put_embeddings(const std::vector<std::string>& chunk_ids,
                                        const std::vector<std::vector<float>>& embeddings) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (size_t i = 0; i < chunk_ids.size() && i < embeddings.size(); ++i) {
    if (chunks_.count(chunk_ids[i])) {
      embeddings_[chunk_ids[i]] = embeddings[i];
    }
  }
}

std::vector<std::pair<std::string, std::vector<float>>> InMemoryChunkStore::embeddings() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {embeddings_.begin(), embeddings_.end()};
}

void InMemoryChunkStore::forget(const std::string& chunk_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  chunks_.erase(chunk_id);
  embeddings_.erase(chunk_id);
}

}  // namespace folio_tests
