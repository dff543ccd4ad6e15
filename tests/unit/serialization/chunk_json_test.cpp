#include <gtest/gtest.h>

#include <string>

#include "common/utilities_test.hpp"
#include "folio_core/serialization/chunk_json.hpp"

namespace folio_core {

class ChunkJsonTest : public ::testing::Test {};

TEST_F(ChunkJsonTest, BoundingBox_ArrayAndObjectForms) {
  auto from_array = nlohmann::json::parse("[1, 2, 3, 4]").get<BoundingBox>();
  auto from_object = nlohmann::json::parse(R"({"x0": 5, "y0": 6, "x1": 7, "y1": 8})").get<BoundingBox>();

  EXPECT_DOUBLE_EQ(from_array.y1, 4.0);
  EXPECT_DOUBLE_EQ(from_object.x0, 5.0);
  EXPECT_EQ(nlohmann::json(from_array), nlohmann::json::parse("[1.0, 2.0, 3.0, 4.0]"));
}

TEST_F(ChunkJsonTest, Chunk_SerialisesFlagsAndNullLabel) {
  // Arrange
  auto chunk = folio_tests::TestUtilities::create_test_chunk("id1", "Plain text.");
  chunk.tables.push_back(folio_tests::TestUtilities::create_test_table("table_1", 1));

  // Act
  nlohmann::json j = chunk;

  // Assert
  EXPECT_EQ(j["chunk_id"], "id1");
  EXPECT_EQ(j["content_kind"], "text");
  EXPECT_TRUE(j["label"].is_null());
  EXPECT_FALSE(j["has_image"].get<bool>());
  EXPECT_TRUE(j["has_table"].get<bool>());
  EXPECT_FALSE(j["has_equation"].get<bool>());
  EXPECT_EQ(j["context"]["chapter_name"], "Sets");
  EXPECT_EQ(j["tables"][0]["table_id"], "table_1");
  EXPECT_TRUE(j["tables"][0]["bbox"].is_null());
}

TEST_F(ChunkJsonTest, RetrievalResult_NestsChunk) {
  RetrievalResult result;
  result.chunk = folio_tests::TestUtilities::create_test_chunk("id1", "text", ContentKind::Example);
  result.chunk.label = "4";
  result.score = 0.5;
  result.rank = 1;

  nlohmann::json j = result;

  EXPECT_EQ(j["rank"], 1);
  EXPECT_DOUBLE_EQ(j["score"].get<double>(), 0.5);
  EXPECT_EQ(j["chunk"]["label"], "4");
  EXPECT_EQ(j["chunk"]["content_kind"], "example");
}

TEST_F(ChunkJsonTest, ChunkPayload_RestoresMediaAndEquations) {
  // Arrange
  auto original = folio_tests::TestUtilities::create_test_chunk("id1", "text");
  original.page_numbers = {3, 4};
  original.equations.push_back({"eq_1", "a+b", "$a+b$", true, false});
  original.images.push_back(folio_tests::TestUtilities::create_test_image("fig_3_1", 3, "Fig. 3.1"));

  // Act
  Chunk restored;
  chunk_payload_from_json(chunk_payload_to_json(original), restored);

  // Assert
  EXPECT_EQ(restored.page_numbers, (std::vector<int>{3, 4}));
  ASSERT_EQ(restored.equations.size(), 1u);
  EXPECT_EQ(restored.equations[0].original_text, "$a+b$");
  ASSERT_EQ(restored.images.size(), 1u);
  EXPECT_EQ(restored.images[0].caption, "Fig. 3.1");
  EXPECT_TRUE(restored.tables.empty());
}

TEST_F(ChunkJsonTest, ChunkPayload_MissingKeysLeaveDefaults) {
  Chunk restored;

  chunk_payload_from_json(nlohmann::json::object(), restored);

  EXPECT_TRUE(restored.page_numbers.empty());
  EXPECT_TRUE(restored.images.empty());
}

TEST_F(ChunkJsonTest, PageRecordFromJson_MediaInheritsPageNumber) {
  auto page = page_record_from_json(nlohmann::json::parse(
      R"({"page_number": 9, "text": "t", "images": [{"image_id": "a", "page_number": 0}],
          "blocks": [{"text": "block", "bbox": {"x0": 1, "y0": 2, "x1": 3, "y1": 4}}]})"));

  ASSERT_EQ(page.images.size(), 1u);
  EXPECT_EQ(page.images[0].page_number, 9);
  ASSERT_EQ(page.blocks.size(), 1u);
  EXPECT_EQ(page.blocks[0].text, "block");
  EXPECT_DOUBLE_EQ(page.blocks[0].bbox.y1, 4.0);
}

TEST_F(ChunkJsonTest, DocumentSummary_Fields) {
  DocumentSummary summary{"maths_11", "11", 42, {"Chapter 1: Sets"}};

  nlohmann::json j = summary;

  EXPECT_EQ(j["document_id"], "maths_11");
  EXPECT_EQ(j["total_chunks"], 42);
  EXPECT_EQ(j["chapters"][0], "Chapter 1: Sets");
}

}  // namespace folio_core
