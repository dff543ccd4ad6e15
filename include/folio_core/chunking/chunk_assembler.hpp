#pragma once

#include <optional>
#include <string>
#include <vector>

#include "folio_core/chunking/math_detector.hpp"
#include "folio_core/chunking/reference_linker.hpp"
#include "folio_core/config.hpp"
#include "folio_core/types/chunk.hpp"
#include "folio_core/types/page_record.hpp"

namespace folio_core {

struct CollectedParagraph {
  std::string text;
  int page_number = 0;
};

// The body of an exercise/example/miscellaneous header while it is being
// gathered, possibly across several pages.
struct OpenCollection {
  CollectionKind kind = CollectionKind::Exercise;
  // Miscellaneous collections gather either exercises or examples
  CollectionKind subject = CollectionKind::Exercise;
  std::optional<std::string> label;
  int start_page = 0;
  std::vector<CollectedParagraph> paragraphs;
  std::vector<PageImage> images;
  std::vector<PageTable> tables;
  // Pages crossed while open that had media but no text
  std::vector<int> media_only_pages;
  // Pool media cited by text anywhere on the pages it came from
  MediaKeySet cited_on_pages;
  StructuralContext context;

  void append_text(const std::string& text, int page_number);
  // Adds the page's media to the pool, skipping ids already present
  void add_page_media(const PageRecord& page);

  ContentKind content_kind() const;
  std::string text() const;
  // Pages that contributed text or media-only pages, ascending
  std::vector<int> pages() const;
};

struct AssemblyContext {
  std::string document_id;
  std::string class_level;
};

struct AssembledGroup {
  std::vector<Chunk> chunks;
  LinkReport link_report;
};

/**
 * @brief Packages collected text and media into chunks.
 *
 * Chunk ids and sequence numbers are left empty; the Segmenter assigns them
 * in emission order.
 */
class ChunkAssembler {
 public:
  explicit ChunkAssembler(ChunkingConfig config = {}, ReferenceLinker linker = ReferenceLinker());

  // Splits at paragraph boundaries so every part's core text fits
  // max_chunk_size bytes. Parts after the first get a continuation header.
  // rescue_excluded is passed through to ReferenceLinker::link.
  AssembledGroup assemble_collection(const OpenCollection& collection,
                                     const AssemblyContext& assembly,
                                     const MediaKeySet& rescue_excluded = {}) const;

  // Standalone text from one page, split on an approximate token limit.
  AssembledGroup assemble_page_text(const std::string& text,
                                    const PageRecord& page,
                                    const StructuralContext& context,
                                    const AssemblyContext& assembly,
                                    const MediaKeySet& rescue_excluded = {}) const;

  // Paragraphs are separated by blank lines; surrounding whitespace is trimmed
  // and empty paragraphs are dropped.
  static std::vector<std::string> split_paragraphs(const std::string& text);

  // Splits at UTF-8 code point boundaries into pieces of at most max_bytes.
  static std::vector<std::string> hard_split(const std::string& text, size_t max_bytes);

  // "[Exercise 3.2 (Part 2)]"
  static std::string continuation_header(CollectionKind kind,
                                         const std::optional<std::string>& label,
                                         int part_number);

  // words * 1.3
  static size_t estimate_tokens(const std::string& text);

  const ChunkingConfig& config() const {
    return config_;
  }

 private:
  Chunk make_chunk(const std::string& text,
                   ContentKind kind,
                   int page_number,
                   std::vector<int> page_numbers,
                   const StructuralContext& context,
                   const AssemblyContext& assembly) const;

  ChunkingConfig config_;
  ReferenceLinker linker_;
  MathDetector math_detector_;
};

}  // namespace folio_core
