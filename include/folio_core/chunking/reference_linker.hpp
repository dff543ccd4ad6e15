#pragma once

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "folio_core/types/chunk.hpp"

namespace folio_core {

enum class MediaKind { Image, Table };

std::string to_string(MediaKind kind);

using MediaKey = std::pair<MediaKind, std::string>;
using MediaKeySet = std::set<MediaKey>;

// A media item that no chunk claimed, reported through ChunkingDiagnostics.
struct DroppedMedia {
  std::string media_id;
  MediaKind kind = MediaKind::Image;
  int page_number = 0;
};

/**
 * @brief Decides where media without an explicit citation goes.
 *
 * Implementations return the indexes of the chunks in the group that should
 * receive the orphan. An empty result drops it.
 */
class OrphanRescueStrategy {
 public:
  virtual ~OrphanRescueStrategy() = default;

  virtual std::vector<size_t> select_targets(const std::vector<Chunk>& group,
                                             int media_page,
                                             const std::optional<BoundingBox>& media_bbox) const = 0;
};

// Attaches an orphan to every chunk of the group recorded on the orphan's page.
class SamePageRescue : public OrphanRescueStrategy {
 public:
  std::vector<size_t> select_targets(const std::vector<Chunk>& group,
                                     int media_page,
                                     const std::optional<BoundingBox>& media_bbox) const override;
};

struct LinkReport {
  size_t linked_by_citation = 0;
  size_t rescued = 0;
  // Media this group did not place. Another group may still claim it.
  std::vector<DroppedMedia> dropped;
};

class ReferenceLinker {
 public:
  // A null strategy selects SamePageRescue.
  explicit ReferenceLinker(std::shared_ptr<const OrphanRescueStrategy> rescue_strategy = nullptr);

  /**
   * @brief Attaches images and tables to the chunks of one group.
   *
   * Phase 1 attaches media cited in a chunk's text ("Fig. 2.1", "Table 3").
   * Phase 2 hands everything phase 1 left unclaimed to the rescue strategy,
   * except media in rescue_excluded: items cited by text outside the group
   * or already placed elsewhere are not orphans.
   * A chunk never receives the same media id twice.
   */
  LinkReport link(std::vector<Chunk>& group,
                  const std::vector<PageImage>& images,
                  const std::vector<PageTable>& tables,
                  const MediaKeySet& rescue_excluded = {}) const;

  // The images and tables whose reference number text cites.
  static MediaKeySet cited_media(const std::string& text,
                                 const std::vector<PageImage>& images,
                                 const std::vector<PageTable>& tables);

  // Normalized reference numbers cited in text, in order of appearance.
  static std::vector<std::string> find_citations(const std::string& text, MediaKind kind);

  // The number a media item carries in its identifier ("fig_2_1") or, failing
  // that, in its caption.
  static std::optional<std::string> media_reference_number(const std::string& media_id,
                                                           const std::string& caption,
                                                           MediaKind kind);

  // "2_1" -> "2.1", "3.4." -> "3.4"
  static std::string normalize_reference_number(const std::string& raw);

 private:
  std::shared_ptr<const OrphanRescueStrategy> rescue_strategy_;
};

}  // namespace folio_core
