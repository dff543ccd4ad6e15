#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "folio_core/chunking/chunk_assembler.hpp"
#include "folio_core/chunking/header_patterns.hpp"
#include "folio_core/config.hpp"
#include "folio_core/types/chunk.hpp"
#include "folio_core/types/page_record.hpp"

namespace folio_core {

struct ChunkingDiagnostics {
  std::vector<DroppedMedia> dropped_media;
  size_t collections_closed = 0;
};

struct ChunkingResult {
  std::vector<Chunk> chunks;
  ChunkingDiagnostics diagnostics;
};

// Everything the page loop carries from one page to the next.
struct SegmenterState {
  std::string document_id;
  std::string class_level;
  StructuralContext context;
  std::optional<OpenCollection> collection;
  int next_sequence = 0;
  // Media attached somewhere in the document
  MediaKeySet attached_media;
  std::vector<DroppedMedia> pending_drops;
};

/**
 * @brief Turns an ordered stream of pages into structure-aware chunks.
 *
 * Headers found at line starts split each page into segments. Text after an
 * exercise, example or miscellaneous header is gathered into an open
 * collection that may span pages and is closed by the next header of any
 * kind. Everything else becomes standalone chunks of its page.
 */
class Segmenter {
 public:
  explicit Segmenter(ChunkingConfig config = {},
                     std::shared_ptr<const OrphanRescueStrategy> rescue_strategy = nullptr);

  // Pages without a positive page number are numbered by position (1-based).
  ChunkingResult chunk_document(const std::vector<PageRecord>& pages,
                                const std::string& document_id,
                                const std::string& class_level) const;

  SegmenterState begin_document(const std::string& document_id, const std::string& class_level) const;
  void process_page(SegmenterState& state, const PageRecord& page, ChunkingResult& sink) const;
  // Closes any open collection and resolves media that no group kept.
  void finish_document(SegmenterState& state, ChunkingResult& sink) const;

 private:
  // Returns false for a blank segment, which receives none of the page's media.
  bool handle_segment(SegmenterState& state,
                      const PageRecord& page,
                      const std::string& segment,
                      const MediaKeySet& page_cited,
                      ChunkingResult& sink) const;
  void handle_media_only_page(SegmenterState& state,
                              const PageRecord& page,
                              const MediaKeySet& page_cited) const;
  void close_collection(SegmenterState& state, ChunkingResult& sink) const;
  void apply_header(SegmenterState& state, const HeaderMatch& header, int page_number) const;
  // Stamps ids and sequence numbers and hands the group to the sink.
  void emit(SegmenterState& state, AssembledGroup group, ChunkingResult& sink) const;

  ChunkAssembler assembler_;
};

}  // namespace folio_core
