#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "folio_core/types/content_kind.hpp"
#include "folio_core/types/page_record.hpp"

namespace folio_core {

// Chapter/section position of a chunk. Only the Segmenter changes it, and only
// when it sees a chapter or section header.
struct StructuralContext {
  int chapter_number = 0;
  std::string chapter_name = "Introduction";
  std::string section_name;
};

struct EquationData {
  std::string equation_id;
  std::string latex;
  std::string original_text;
  bool is_inline = true;
  bool is_multiline = false;
};

struct Chunk {
  std::string chunk_id;
  std::string document_id;
  std::string class_level;
  // Position of the chunk within its document
  int sequence = 0;
  StructuralContext context;
  ContentKind content_kind = ContentKind::Text;
  int page_number = 0;
  std::vector<int> page_numbers;
  std::string text_content;
  std::vector<EquationData> equations;
  std::vector<PageImage> images;
  std::vector<PageTable> tables;
  // Example or exercise number ("3.1", "5"), set for collection chunks
  std::optional<std::string> label;
  int part_index = 1;
  int part_count = 1;
  size_t char_count = 0;
  size_t token_count = 0;
  double math_density = 0.0;

  std::optional<std::string> example_number() const;
  std::optional<std::string> exercise_number() const;

  bool has_image() const {
    return !images.empty();
  }
  bool has_table() const {
    return !tables.empty();
  }
  bool has_equation() const {
    return !equations.empty();
  }

  // Text handed to the embedding model: location, kind, body and equations.
  std::string full_context() const;
};

struct RetrievalResult {
  Chunk chunk;
  double score = 0.0;
  // 1-based
  int rank = 0;
};

// An id with a relevance score, as returned by the vector and keyword indexes.
struct ScoredId {
  std::string id;
  double score = 0.0;
};

}  // namespace folio_core
