#pragma once

#include <optional>
#include <string>

#include "folio_core/types/chunk.hpp"

namespace folio_core {

// Metadata predicate set. Unset fields match everything.
struct ChunkFilter {
  std::optional<std::string> document_id;
  std::optional<std::string> class_level;
  std::optional<int> chapter_number;
  std::optional<ContentKind> content_kind;
  // Example/exercise number
  std::optional<std::string> label;

  bool empty() const {
    return !document_id && !class_level && !chapter_number && !content_kind && !label;
  }

  bool matches(const Chunk& chunk) const {
    if (document_id && chunk.document_id != *document_id) return false;
    if (class_level && chunk.class_level != *class_level) return false;
    if (chapter_number && chunk.context.chapter_number != *chapter_number) return false;
    if (content_kind && chunk.content_kind != *content_kind) return false;
    if (label && chunk.label != label) return false;
    return true;
  }
};

}  // namespace folio_core
