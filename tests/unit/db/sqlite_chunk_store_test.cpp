#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "../../common/utilities_test.hpp"
#include "folio_core/db/pooled_connection.hpp"

namespace folio_core {

class SqliteChunkStoreTest : public folio_tests::ChunkStoreTestBase {
 protected:
  using TU = folio_tests::TestUtilities;

  Chunk rich_chunk() {
    auto chunk = TU::create_test_chunk("rich", "EXAMPLE 2.1\nAs shown in Fig 2.1, $x^2 = 4$.", ContentKind::Example,
                                       "maths_11", 4);
    chunk.label = "2.1";
    chunk.context.chapter_number = 2;
    chunk.context.chapter_name = "Relations and Functions";
    chunk.context.section_name = "CARTESIAN PRODUCT";
    chunk.page_number = 31;
    chunk.page_numbers = {31, 32};
    chunk.part_index = 2;
    chunk.part_count = 3;
    chunk.math_density = 0.25;
    chunk.equations.push_back({"eq_1", "x^2 = 4", "$x^2 = 4$", true, false});
    auto image = TU::create_test_image("fig_2_1", 31, "Fig. 2.1 Arrow diagram");
    image.bbox = BoundingBox{10.0, 20.0, 110.0, 220.0};
    chunk.images.push_back(image);
    chunk.tables.push_back(TU::create_test_table("table_2_1", 32));
    return chunk;
  }
};

TEST_F(SqliteChunkStoreTest, PutAndGet_RoundTripsEveryField) {
  // Arrange
  const auto original = rich_chunk();

  // Act
  chunk_store_->put({original});
  auto loaded = chunk_store_->get("rich");

  // Assert
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->chunk_id, original.chunk_id);
  EXPECT_EQ(loaded->document_id, "maths_11");
  EXPECT_EQ(loaded->class_level, "11");
  EXPECT_EQ(loaded->sequence, 4);
  EXPECT_EQ(loaded->context.chapter_number, 2);
  EXPECT_EQ(loaded->context.chapter_name, "Relations and Functions");
  EXPECT_EQ(loaded->context.section_name, "CARTESIAN PRODUCT");
  EXPECT_EQ(loaded->content_kind, ContentKind::Example);
  EXPECT_EQ(loaded->label, std::optional<std::string>("2.1"));
  EXPECT_EQ(loaded->page_number, 31);
  EXPECT_EQ(loaded->page_numbers, (std::vector<int>{31, 32}));
  EXPECT_EQ(loaded->text_content, original.text_content);
  EXPECT_EQ(loaded->part_index, 2);
  EXPECT_EQ(loaded->part_count, 3);
  EXPECT_EQ(loaded->char_count, original.char_count);
  EXPECT_EQ(loaded->token_count, original.token_count);
  EXPECT_DOUBLE_EQ(loaded->math_density, 0.25);
  ASSERT_EQ(loaded->equations.size(), 1u);
  EXPECT_EQ(loaded->equations[0].latex, "x^2 = 4");
  ASSERT_EQ(loaded->images.size(), 1u);
  EXPECT_EQ(loaded->images[0].image_id, "fig_2_1");
  EXPECT_EQ(loaded->images[0].caption, "Fig. 2.1 Arrow diagram");
  ASSERT_TRUE(loaded->images[0].bbox.has_value());
  EXPECT_DOUBLE_EQ(loaded->images[0].bbox->x1, 110.0);
  ASSERT_EQ(loaded->tables.size(), 1u);
  EXPECT_EQ(loaded->tables[0].body, original.tables[0].body);
  EXPECT_EQ(loaded->tables[0].page_number, 32);
}

TEST_F(SqliteChunkStoreTest, Get_UnknownIdReturnsNullopt) {
  EXPECT_FALSE(chunk_store_->get("missing").has_value());
}

TEST_F(SqliteChunkStoreTest, Put_NullLabelStaysNull) {
  chunk_store_->put({TU::create_test_chunk("plain", "Plain text.")});

  auto loaded = chunk_store_->get("plain");

  ASSERT_TRUE(loaded.has_value());
  EXPECT_FALSE(loaded->label.has_value());
}

TEST_F(SqliteChunkStoreTest, Put_SameIdReplaces) {
  chunk_store_->put({TU::create_test_chunk("a", "first version")});

  chunk_store_->put({TU::create_test_chunk("a", "second version")});

  auto all = chunk_store_->filter({});
  ASSERT_EQ(all.size(), 1u);
  EXPECT_EQ(all[0].text_content, "second version");
}

TEST_F(SqliteChunkStoreTest, Filter_CombinesPredicatesInDocumentOrder) {
  // Arrange
  auto examples = TU::create_example_chunks(3, "maths_11");
  auto other = TU::create_example_chunks(2, "maths_12");
  other[0].class_level = "12";
  other[1].class_level = "12";
  auto text = TU::create_test_chunk("text", "Sets are collections.", ContentKind::Text, "maths_11", 10);
  chunk_store_->put(examples);
  chunk_store_->put(other);
  chunk_store_->put({text});

  // Act
  ChunkFilter by_document;
  by_document.document_id = "maths_11";
  ChunkFilter by_label;
  by_label.content_kind = ContentKind::Example;
  by_label.label = "2";
  ChunkFilter by_class;
  by_class.class_level = "12";
  ChunkFilter by_chapter;
  by_chapter.chapter_number = 7;

  // Assert
  auto document_chunks = chunk_store_->filter(by_document);
  ASSERT_EQ(document_chunks.size(), 4u);
  for (size_t i = 1; i < document_chunks.size(); ++i) {
    EXPECT_LT(document_chunks[i - 1].sequence, document_chunks[i].sequence);
  }

  auto labelled = chunk_store_->filter(by_label);
  ASSERT_EQ(labelled.size(), 2u);
  EXPECT_EQ(labelled[0].document_id, "maths_11");
  EXPECT_EQ(labelled[1].document_id, "maths_12");

  EXPECT_EQ(chunk_store_->filter(by_class).size(), 2u);
  EXPECT_TRUE(chunk_store_->filter(by_chapter).empty());
  EXPECT_EQ(chunk_store_->filter({}).size(), 6u);
}

TEST_F(SqliteChunkStoreTest, DeleteByDocument_ReturnsRemovedIds) {
  chunk_store_->put(TU::create_example_chunks(3, "maths_11"));
  chunk_store_->put(TU::create_example_chunks(2, "maths_12"));

  auto removed = chunk_store_->delete_by_document("maths_11");

  EXPECT_EQ(removed, (std::vector<std::string>{"maths_11_example_1", "maths_11_example_2", "maths_11_example_3"}));
  EXPECT_EQ(chunk_store_->filter({}).size(), 2u);
  EXPECT_TRUE(chunk_store_->delete_by_document("maths_11").empty());
}

TEST_F(SqliteChunkStoreTest, ListDocuments_SummarisesChapters) {
  // Arrange
  auto intro = TU::create_test_chunk("i", "Intro", ContentKind::Text, "maths_11", 0);
  intro.context.chapter_number = 1;
  intro.context.chapter_name = "Sets";
  auto later = TU::create_test_chunk("l", "Later", ContentKind::Text, "maths_11", 1);
  later.context.chapter_number = 2;
  later.context.chapter_name = "Relations and Functions";
  auto again = TU::create_test_chunk("a", "Again", ContentKind::Text, "maths_11", 2);
  again.context.chapter_number = 2;
  again.context.chapter_name = "Relations and Functions";
  chunk_store_->put({intro, later, again});
  chunk_store_->put(TU::create_example_chunks(1, "maths_12"));

  // Act
  auto documents = chunk_store_->list_documents();

  // Assert
  ASSERT_EQ(documents.size(), 2u);
  EXPECT_EQ(documents[0].document_id, "maths_11");
  EXPECT_EQ(documents[0].class_level, "11");
  EXPECT_EQ(documents[0].total_chunks, 3u);
  EXPECT_EQ(documents[0].chapters,
            (std::vector<std::string>{"Chapter 1: Sets", "Chapter 2: Relations and Functions"}));
  EXPECT_EQ(documents[1].document_id, "maths_12");
  EXPECT_EQ(documents[1].total_chunks, 1u);
}

TEST_F(SqliteChunkStoreTest, Embeddings_StoredBesideChunks) {
  // Arrange
  chunk_store_->put(TU::create_example_chunks(2, "maths_11"));
  const std::vector<float> first = {0.5f, -1.25f, 3.0f};

  // Act
  chunk_store_->put_embeddings({"maths_11_example_1", "unknown"}, {first, {1.0f, 2.0f, 3.0f}});
  auto stored = chunk_store_->embeddings();

  // Assert
  ASSERT_EQ(stored.size(), 1u);
  EXPECT_EQ(stored[0].first, "maths_11_example_1");
  EXPECT_EQ(stored[0].second, first);
}

TEST_F(SqliteChunkStoreTest, Embeddings_RemovedWithDocument) {
  chunk_store_->put(TU::create_example_chunks(1, "maths_11"));
  chunk_store_->put_embeddings({"maths_11_example_1"}, {{1.0f, 0.0f}});

  chunk_store_->delete_by_document("maths_11");

  EXPECT_TRUE(chunk_store_->embeddings().empty());
}

TEST_F(SqliteChunkStoreTest, PutEmbeddings_SizeMismatchThrows) {
  EXPECT_THROW(chunk_store_->put_embeddings({"a", "b"}, {{1.0f}}), ChunkStoreError);
}

TEST_F(SqliteChunkStoreTest, Get_CorruptMediaPayloadKeepsText) {
  chunk_store_->put({TU::create_test_chunk("a", "Still readable.")});
  {
    PooledConnection conn(*db_manager_);
    *conn << "UPDATE chunks SET media_json = 'not json' WHERE id = 'a'";
  }

  auto loaded = chunk_store_->get("a");

  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->text_content, "Still readable.");
  EXPECT_TRUE(loaded->images.empty());
}

}  // namespace folio_core
