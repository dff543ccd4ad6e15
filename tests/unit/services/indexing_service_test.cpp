#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/mocks_test.hpp"
#include "common/utilities_test.hpp"
#include "folio_core/retrieval/keyword_index.hpp"
#include "folio_core/vector/faiss_vector_index.hpp"
#include "folio_services/indexing_service.hpp"

namespace folio_services {

using folio_core::ChunkFilter;
using folio_core::PageRecord;
using folio_tests::MockEmbeddingProvider;
using folio_tests::TestUtilities;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Throw;

class IndexingServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    chunk_store_ = std::make_shared<folio_tests::InMemoryChunkStore>();
    vector_index_ = std::make_shared<folio_core::FaissVectorIndex>(
        static_cast<int>(MockEmbeddingProvider::DIMENSION));
    keyword_index_ = std::make_shared<folio_core::Bm25KeywordIndex>();
    embedder_ = std::make_shared<NiceMock<MockEmbeddingProvider>>();
    service_ = std::make_unique<IndexingService>(chunk_store_, vector_index_, keyword_index_, embedder_);
  }

  // Intro text, an exercise spanning both pages and a miscellaneous collection
  std::vector<PageRecord> matrices_pages() {
    return {TestUtilities::create_test_page(1,
                                            "CHAPTER 3 Matrices\nA matrix is an ordered rectangular array.\n\n"
                                            "EXERCISE 3.1\n1. Find the order of A.\n\n2. Construct a matrix."),
            TestUtilities::create_test_page(2,
                                            "3. Compute the transpose.\n\nMISCELLANEOUS EXERCISES\n"
                                            "1. Show that A is symmetric.")};
  }

  std::vector<PageRecord> short_pages() {
    return {TestUtilities::create_test_page(1, "EXERCISE 3.1\n1. Solve x."),
            TestUtilities::create_test_page(2, "MISCELLANEOUS EXERCISE\n1. Solve y.")};
  }

  size_t stored_chunks(const std::string& document_id) {
    ChunkFilter filter;
    filter.document_id = document_id;
    return chunk_store_->filter(filter).size();
  }

  std::shared_ptr<folio_tests::InMemoryChunkStore> chunk_store_;
  std::shared_ptr<folio_core::FaissVectorIndex> vector_index_;
  std::shared_ptr<folio_core::Bm25KeywordIndex> keyword_index_;
  std::shared_ptr<NiceMock<MockEmbeddingProvider>> embedder_;
  std::unique_ptr<IndexingService> service_;
};

TEST_F(IndexingServiceTest, IndexDocument_StoresChunksAndFillsIndexes) {
  // Act
  IndexingStats stats = service_->index_document(matrices_pages(), "maths_12", "12");

  // Assert
  EXPECT_EQ(stats.document_id, "maths_12");
  EXPECT_EQ(stats.class_level, "12");
  EXPECT_EQ(stats.total_pages, 2u);
  EXPECT_EQ(stats.total_chunks, 3u);
  EXPECT_EQ(stats.total_embeddings, 3u);
  EXPECT_TRUE(stats.dropped_media.empty());

  EXPECT_EQ(stored_chunks("maths_12"), 3u);
  EXPECT_EQ(vector_index_->size(), 3u);
  EXPECT_EQ(keyword_index_->size(), 3u);
  EXPECT_EQ(chunk_store_->embeddings().size(), 3u);
}

TEST_F(IndexingServiceTest, IndexDocument_EmbedsFullContext) {
  // Arrange
  std::vector<std::string> embedded;
  ON_CALL(*embedder_, get_embedding(_)).WillByDefault(Invoke([&embedded](const std::string& text) {
    embedded.push_back(text);
    return std::vector<float>(MockEmbeddingProvider::DIMENSION, 0.1f);
  }));

  // Act
  service_->index_document(short_pages(), "doc", "11");

  // Assert
  ASSERT_EQ(embedded.size(), 2u);
  auto chunk = chunk_store_->filter({})[0];
  EXPECT_THAT(embedded, ::testing::Contains(chunk.full_context()));
}

TEST_F(IndexingServiceTest, IndexDocument_ReportsDroppedMedia) {
  std::vector<PageRecord> pages = {
      TestUtilities::create_test_page(1, "EXERCISE 1.1\n1. Name the set."),
      TestUtilities::create_test_page(2, "2. List its elements.",
                                      {TestUtilities::create_test_image("photo_7", 2)})};

  IndexingStats stats = service_->index_document(pages, "doc", "11");

  ASSERT_EQ(stats.dropped_media.size(), 1u);
  EXPECT_EQ(stats.dropped_media[0].media_id, "photo_7");
  EXPECT_EQ(stats.total_images, 0u);
}

TEST_F(IndexingServiceTest, IndexDocument_ReindexReplacesPreviousVersion) {
  // Arrange
  service_->index_document(matrices_pages(), "doc", "12");

  // Act
  IndexingStats stats = service_->index_document(short_pages(), "doc", "12");

  // Assert
  EXPECT_EQ(stats.total_chunks, 2u);
  EXPECT_EQ(stored_chunks("doc"), 2u);
  EXPECT_EQ(vector_index_->size(), 2u);
  EXPECT_EQ(keyword_index_->size(), 2u);
}

TEST_F(IndexingServiceTest, IndexDocument_KeepsOtherDocuments) {
  service_->index_document(matrices_pages(), "book_a", "12");
  service_->index_document(short_pages(), "book_b", "11");

  EXPECT_EQ(stored_chunks("book_a"), 3u);
  EXPECT_EQ(stored_chunks("book_b"), 2u);
  EXPECT_EQ(vector_index_->size(), 5u);
  EXPECT_EQ(keyword_index_->size(), 5u);
}

TEST_F(IndexingServiceTest, IndexDocument_EmbedderFailureLeavesPreviousVersion) {
  // Arrange
  service_->index_document(matrices_pages(), "doc", "12");
  EXPECT_CALL(*embedder_, get_embedding(_)).WillOnce(Throw(std::runtime_error("model unavailable")));

  // Act & Assert
  EXPECT_THROW(service_->index_document(short_pages(), "doc", "12"), std::runtime_error);
  EXPECT_EQ(stored_chunks("doc"), 3u);
  EXPECT_EQ(vector_index_->size(), 3u);
  EXPECT_EQ(keyword_index_->size(), 3u);
}

TEST_F(IndexingServiceTest, IndexDocument_EmptyPagesStoresNothing) {
  IndexingStats stats = service_->index_document({}, "empty", "11");

  EXPECT_EQ(stats.total_chunks, 0u);
  EXPECT_EQ(stats.total_embeddings, 0u);
  EXPECT_EQ(vector_index_->size(), 0u);
  EXPECT_TRUE(chunk_store_->filter({}).empty());
}

TEST_F(IndexingServiceTest, DeleteDocument_RemovesChunksAndVectors) {
  // Arrange
  service_->index_document(matrices_pages(), "book_a", "12");
  service_->index_document(short_pages(), "book_b", "11");

  // Act
  size_t removed = service_->delete_document("book_a");

  // Assert
  EXPECT_EQ(removed, 3u);
  EXPECT_EQ(stored_chunks("book_a"), 0u);
  EXPECT_EQ(stored_chunks("book_b"), 2u);
  EXPECT_EQ(vector_index_->size(), 2u);
  EXPECT_EQ(keyword_index_->size(), 2u);
}

TEST_F(IndexingServiceTest, DeleteDocument_UnknownDocumentReturnsZero) {
  service_->index_document(short_pages(), "doc", "11");

  EXPECT_EQ(service_->delete_document("missing"), 0u);
  EXPECT_EQ(vector_index_->size(), 2u);
}

TEST_F(IndexingServiceTest, RestoreIndexes_SkipsEmbeddingsOfWrongDimension) {
  // Arrange
  chunk_store_->put({TestUtilities::create_test_chunk("good", "sets and subsets"),
                     TestUtilities::create_test_chunk("stale", "relations and functions")});
  chunk_store_->put_embeddings({"good", "stale"},
                               {std::vector<float>(MockEmbeddingProvider::DIMENSION, 0.5f),
                                std::vector<float>(3, 0.5f)});

  // Act
  service_->restore_indexes();

  // Assert
  EXPECT_EQ(vector_index_->size(), 1u);
  auto hits = vector_index_->search(std::vector<float>(MockEmbeddingProvider::DIMENSION, 1.0f), 5);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].id, "good");
  EXPECT_EQ(keyword_index_->size(), 2u);
}

TEST_F(IndexingServiceTest, RebuildKeywordIndex_ReflectsStore) {
  // Arrange
  chunk_store_->put({TestUtilities::create_test_chunk("a", "union of sets"),
                     TestUtilities::create_test_chunk("b", "intersection of sets")});
  EXPECT_EQ(keyword_index_->size(), 0u);

  // Act
  service_->rebuild_keyword_index();

  // Assert
  EXPECT_EQ(keyword_index_->size(), 2u);
}

}  // namespace folio_services
