#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include "common/mocks_test.hpp"
#include "common/utilities_test.hpp"
#include "folio_core/retrieval/hybrid_retriever.hpp"

namespace folio_core {

using folio_tests::MockUtilities::ranked_ids;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

class HybridRetrieverTest : public ::testing::Test {
 protected:
  void SetUp() override {
    using TU = folio_tests::TestUtilities;
    store_ = std::make_shared<folio_tests::InMemoryChunkStore>();
    vector_index_ = std::make_shared<NiceMock<folio_tests::MockVectorIndex>>();
    keyword_index_ = std::make_shared<NiceMock<folio_tests::MockKeywordIndex>>();
    embedder_ = std::make_shared<NiceMock<folio_tests::MockEmbeddingProvider>>();

    auto definition = TU::create_test_chunk("a", "A matrix is a rectangular array.", ContentKind::Definition);
    auto text = TU::create_test_chunk("b", "Matrices can be added entry by entry.", ContentKind::Text);
    auto example = TU::create_test_chunk("c", "EXAMPLE 5\nAdd the two matrices.", ContentKind::Example);
    example.label = "5";
    example.context.chapter_number = 3;
    store_->put({definition, text, example});

    ON_CALL(*vector_index_, size()).WillByDefault(Return(3));
    ON_CALL(*keyword_index_, size()).WillByDefault(Return(3));

    retriever_ = std::make_unique<HybridRetriever>(store_, vector_index_, keyword_index_, embedder_);
  }

  std::vector<std::string> ids_of(const std::vector<RetrievalResult>& results) {
    std::vector<std::string> ids;
    for (const auto& result : results) {
      ids.push_back(result.chunk.chunk_id);
    }
    return ids;
  }

  std::shared_ptr<folio_tests::InMemoryChunkStore> store_;
  std::shared_ptr<NiceMock<folio_tests::MockVectorIndex>> vector_index_;
  std::shared_ptr<NiceMock<folio_tests::MockKeywordIndex>> keyword_index_;
  std::shared_ptr<NiceMock<folio_tests::MockEmbeddingProvider>> embedder_;
  std::unique_ptr<HybridRetriever> retriever_;
};

TEST_F(HybridRetrieverTest, Fuse_SharedIdsAccumulateBothContributions) {
  // Act
  auto fused = HybridRetriever::fuse(ranked_ids({"a", "b"}), ranked_ids({"b", "c"}), 0.5, 60.0);

  // Assert
  ASSERT_EQ(fused.size(), 3u);
  EXPECT_EQ(fused[0].id, "b");
  EXPECT_DOUBLE_EQ(fused[0].score, 0.5 / 62.0 + 0.5 / 61.0);
  EXPECT_EQ(fused[1].id, "a");
  EXPECT_DOUBLE_EQ(fused[1].score, 0.5 / 61.0);
  EXPECT_EQ(fused[2].id, "c");
  EXPECT_DOUBLE_EQ(fused[2].score, 0.5 / 62.0);
}

TEST_F(HybridRetrieverTest, Fuse_TiesKeepFirstSeenOrder) {
  auto fused = HybridRetriever::fuse(ranked_ids({"v"}), ranked_ids({"l"}), 0.5, 60.0);

  ASSERT_EQ(fused.size(), 2u);
  EXPECT_EQ(fused[0].id, "v");
  EXPECT_EQ(fused[1].id, "l");
  EXPECT_DOUBLE_EQ(fused[0].score, fused[1].score);
}

TEST_F(HybridRetrieverTest, Fuse_AlphaWeightsLists) {
  auto vector_heavy = HybridRetriever::fuse(ranked_ids({"v"}), ranked_ids({"l"}), 0.7, 60.0);
  auto lexical_heavy = HybridRetriever::fuse(ranked_ids({"v"}), ranked_ids({"l"}), 0.3, 60.0);

  EXPECT_EQ(vector_heavy[0].id, "v");
  EXPECT_EQ(lexical_heavy[0].id, "l");
}

TEST_F(HybridRetrieverTest, Fuse_IsDeterministicAndIgnoresDuplicateIds) {
  auto first = HybridRetriever::fuse(ranked_ids({"a", "a", "b"}), ranked_ids({"c", "b"}), 0.6, 60.0);
  auto second = HybridRetriever::fuse(ranked_ids({"a", "a", "b"}), ranked_ids({"c", "b"}), 0.6, 60.0);

  ASSERT_EQ(first.size(), 3u);
  for (size_t i = 0; i < first.size(); ++i) {
    EXPECT_EQ(first[i].id, second[i].id);
    EXPECT_DOUBLE_EQ(first[i].score, second[i].score);
  }
  // "b" is second in the vector list once the duplicate "a" is ignored
  const auto b = std::find_if(first.begin(), first.end(), [](const ScoredId& s) { return s.id == "b"; });
  EXPECT_DOUBLE_EQ(b->score, 0.6 / 62.0 + 0.4 / 62.0);
}

TEST_F(HybridRetrieverTest, SelectAlpha_EntityQueriesFavourKeywords) {
  EXPECT_DOUBLE_EQ(retriever_->select_alpha("Example 5"), 0.3);
  EXPECT_DOUBLE_EQ(retriever_->select_alpha("explain continuity"), 0.7);
}

TEST_F(HybridRetrieverTest, Retrieve_FusesBothSearches) {
  // Arrange
  EXPECT_CALL(*vector_index_, search(_, 4)).WillOnce(Return(ranked_ids({"a", "b"})));
  EXPECT_CALL(*keyword_index_, search("matrix sum", 4)).WillOnce(Return(ranked_ids({"b", "c"})));

  // Act
  auto results = retriever_->retrieve("matrix sum", 2);

  // Assert
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].chunk.chunk_id, "b");
  EXPECT_EQ(results[0].rank, 1);
  EXPECT_EQ(results[1].chunk.chunk_id, "a");
  EXPECT_EQ(results[1].rank, 2);
  EXPECT_GT(results[0].score, results[1].score);
}

TEST_F(HybridRetrieverTest, Retrieve_DefaultTopKFromConfig) {
  ON_CALL(*vector_index_, search(_, _)).WillByDefault(Return(ranked_ids({"a", "b", "c"})));

  auto results = retriever_->retrieve("matrix");

  EXPECT_EQ(results.size(), 3u);
  EXPECT_EQ(retriever_->config().top_k, 5);
}

TEST_F(HybridRetrieverTest, Retrieve_SkipsStaleIds) {
  ON_CALL(*vector_index_, search(_, _)).WillByDefault(Return(ranked_ids({"ghost", "a"})));
  ON_CALL(*keyword_index_, search(_, _)).WillByDefault(Return(ranked_ids({"ghost", "c"})));

  auto results = retriever_->retrieve("matrix", 5);

  EXPECT_EQ(ids_of(results), (std::vector<std::string>{"a", "c"}));
  EXPECT_EQ(results[0].rank, 1);
  EXPECT_EQ(results[1].rank, 2);
}

TEST_F(HybridRetrieverTest, Retrieve_EmptyIndexesYieldNothing) {
  ON_CALL(*vector_index_, size()).WillByDefault(Return(0));
  EXPECT_CALL(*vector_index_, search(_, _)).Times(0);
  EXPECT_CALL(*embedder_, get_embedding(_)).Times(0);
  ON_CALL(*keyword_index_, search(_, _)).WillByDefault(Return(std::vector<ScoredId>{}));

  auto results = retriever_->retrieve("anything", 5);

  EXPECT_TRUE(results.empty());
}

TEST_F(HybridRetrieverTest, Retrieve_NonPositiveTopK) {
  EXPECT_CALL(*vector_index_, search(_, _)).Times(0);

  EXPECT_TRUE(retriever_->retrieve("matrix", 0).empty());
}

TEST_F(HybridRetrieverTest, Retrieve_FiltersRestrictBothSearches) {
  // Arrange
  ChunkFilter filter;
  filter.content_kind = ContentKind::Definition;
  EXPECT_CALL(*vector_index_, search_filtered(_, 2, std::vector<std::string>{"a"}))
      .WillOnce(Return(ranked_ids({"a"})));
  EXPECT_CALL(*vector_index_, search(_, _)).Times(0);
  ON_CALL(*keyword_index_, search(_, _)).WillByDefault(Return(ranked_ids({"b", "a", "c"})));

  // Act
  auto results = retriever_->retrieve("matrix", 1, filter);

  // Assert
  EXPECT_EQ(ids_of(results), std::vector<std::string>{"a"});
}

TEST_F(HybridRetrieverTest, Retrieve_FilterMatchingNothingShortCircuits) {
  ChunkFilter filter;
  filter.document_id = "unknown";
  EXPECT_CALL(*vector_index_, search_filtered(_, _, _)).Times(0);
  EXPECT_CALL(*keyword_index_, search(_, _)).Times(0);

  EXPECT_TRUE(retriever_->retrieve("matrix", 5, filter).empty());
}

TEST_F(HybridRetrieverTest, RetrieveByExample_ExactLabelMatch) {
  EXPECT_CALL(*vector_index_, search_filtered(_, _, std::vector<std::string>{"c"}))
      .WillOnce(Return(ranked_ids({"c"})));
  ON_CALL(*keyword_index_, search(_, _)).WillByDefault(Return(ranked_ids({"a", "c"})));

  auto results = retriever_->retrieve_by_example("Example 5", "5", 3);

  EXPECT_EQ(ids_of(results), std::vector<std::string>{"c"});
  EXPECT_EQ(results[0].chunk.example_number(), std::optional<std::string>("5"));
}

TEST_F(HybridRetrieverTest, RetrieveFromChapter_FiltersByClassAndChapter) {
  EXPECT_CALL(*vector_index_, search_filtered(_, _, std::vector<std::string>{"c"}))
      .WillOnce(Return(ranked_ids({"c"})));

  auto results = retriever_->retrieve_from_chapter("matrices", "11", 3, 5);

  EXPECT_EQ(ids_of(results), std::vector<std::string>{"c"});
}

TEST_F(HybridRetrieverTest, GetRelatedChunks_ExcludesReference) {
  // Arrange
  EXPECT_CALL(*embedder_, get_embedding("A matrix is a rectangular array.")).Times(1);
  ON_CALL(*vector_index_, search(_, _)).WillByDefault(Return(ranked_ids({"a", "b", "c"})));
  ON_CALL(*keyword_index_, search(_, _)).WillByDefault(Return(ranked_ids({"a", "c"})));

  // Act
  auto results = retriever_->get_related_chunks("a", 2);

  // Assert
  ASSERT_EQ(results.size(), 2u);
  for (const auto& result : results) {
    EXPECT_NE(result.chunk.chunk_id, "a");
  }
  EXPECT_EQ(results[0].rank, 1);
  EXPECT_EQ(results[1].rank, 2);
}

TEST_F(HybridRetrieverTest, GetRelatedChunks_UnknownIdIsEmpty) {
  EXPECT_CALL(*vector_index_, search(_, _)).Times(0);

  EXPECT_TRUE(retriever_->get_related_chunks("missing", 3).empty());
}

TEST_F(HybridRetrieverTest, GetRelatedChunks_LongTextQueryIsTruncated) {
  // Arrange: multi-byte characters straddle the 500 byte cut
  auto long_chunk = folio_tests::TestUtilities::create_test_chunk("long", "x");
  for (int i = 0; i < 300; ++i) {
    long_chunk.text_content += "\xC3\xA9";
  }
  store_->put({long_chunk});
  std::string captured;
  EXPECT_CALL(*embedder_, get_embedding(_))
      .WillOnce(Invoke([&captured](const std::string& text) {
        captured = text;
        return std::vector<float>(folio_tests::MockEmbeddingProvider::DIMENSION, 0.1f);
      }));

  // Act
  retriever_->get_related_chunks("long", 2);

  // Assert: 1 + 249 * 2 bytes, ending on a whole code point
  EXPECT_EQ(captured.size(), 499u);
  EXPECT_EQ(captured, long_chunk.text_content.substr(0, 499));
}

}  // namespace folio_core
