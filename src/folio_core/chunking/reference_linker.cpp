#include "folio_core/chunking/reference_linker.hpp"

#include <algorithm>
#include <regex>
#include <unordered_set>

namespace folio_core {

namespace {

const auto ICASE = std::regex_constants::ECMAScript | std::regex_constants::icase;

const std::regex& figure_citation_regex() {
  static const std::regex re(R"(\bfig(?:ure)?\.?\s*(\d+(?:[._\-]\d+)*))", ICASE);
  return re;
}

const std::regex& table_citation_regex() {
  static const std::regex re(R"(\btable\s*(\d+(?:[._\-]\d+)*))", ICASE);
  return re;
}

// Identifiers glue the words to the number: fig_2_1, figure-3.4, table_2_1, tab2
const std::regex& figure_id_regex() {
  static const std::regex re(R"(fig(?:ure)?[\s_.\-]*(\d+(?:[._\-]\d+)*))", ICASE);
  return re;
}

const std::regex& table_id_regex() {
  static const std::regex re(R"(tab(?:le)?[\s_.\-]*(\d+(?:[._\-]\d+)*))", ICASE);
  return re;
}

const std::string& id_of(const PageImage& image) {
  return image.image_id;
}
const std::string& id_of(const PageTable& table) {
  return table.table_id;
}

std::string caption_of(const PageImage& image) {
  return image.caption;
}
// Tables carry their caption, if any, on the first line of the body
std::string caption_of(const PageTable& table) {
  return table.body.substr(0, table.body.find('\n'));
}

template <typename Media>
bool contains_id(const std::vector<Media>& items, const std::string& id) {
  return std::any_of(items.begin(), items.end(),
                     [&id](const Media& item) { return id_of(item) == id; });
}

template <typename Media>
void link_media(std::vector<Chunk>& group,
                const std::vector<Media>& pool,
                MediaKind kind,
                std::vector<Media> Chunk::*slot,
                const OrphanRescueStrategy& rescue,
                const MediaKeySet& rescue_excluded,
                LinkReport& report) {
  if (pool.empty() || group.empty()) {
    return;
  }

  // Phase 1: explicit citations
  std::unordered_set<std::string> claimed;
  for (auto& chunk : group) {
    const auto citations = ReferenceLinker::find_citations(chunk.text_content, kind);
    if (citations.empty()) {
      continue;
    }
    for (const auto& item : pool) {
      const auto number = ReferenceLinker::media_reference_number(id_of(item), caption_of(item), kind);
      if (!number || std::find(citations.begin(), citations.end(), *number) == citations.end()) {
        continue;
      }
      claimed.insert(id_of(item));
      if (!contains_id(chunk.*slot, id_of(item))) {
        (chunk.*slot).push_back(item);
        report.linked_by_citation++;
      }
    }
  }

  // Phase 2: orphans, only after phase 1 has run over the whole group
  std::unordered_set<std::string> seen;
  for (const auto& item : pool) {
    if (claimed.count(id_of(item)) || !seen.insert(id_of(item)).second) {
      continue;
    }
    if (rescue_excluded.count({kind, id_of(item)})) {
      report.dropped.push_back({id_of(item), kind, item.page_number});
      continue;
    }
    const auto targets = rescue.select_targets(group, item.page_number, item.bbox);
    bool attached = false;
    for (size_t index : targets) {
      if (index >= group.size()) {
        continue;
      }
      auto& chunk = group[index];
      if (!contains_id(chunk.*slot, id_of(item))) {
        (chunk.*slot).push_back(item);
        attached = true;
      }
    }
    if (attached) {
      report.rescued++;
    } else if (targets.empty()) {
      report.dropped.push_back({id_of(item), kind, item.page_number});
    }
  }
}

}  // namespace

std::string to_string(MediaKind kind) {
  return kind == MediaKind::Image ? "image" : "table";
}

std::vector<size_t> SamePageRescue::select_targets(const std::vector<Chunk>& group,
                                                   int media_page,
                                                   const std::optional<BoundingBox>& /*media_bbox*/) const {
  std::vector<size_t> targets;
  for (size_t i = 0; i < group.size(); ++i) {
    if (group[i].page_number == media_page) {
      targets.push_back(i);
    }
  }
  return targets;
}

ReferenceLinker::ReferenceLinker(std::shared_ptr<const OrphanRescueStrategy> rescue_strategy)
    : rescue_strategy_(rescue_strategy ? std::move(rescue_strategy)
                                       : std::make_shared<SamePageRescue>()) {}

LinkReport ReferenceLinker::link(std::vector<Chunk>& group,
                                 const std::vector<PageImage>& images,
                                 const std::vector<PageTable>& tables,
                                 const MediaKeySet& rescue_excluded) const {
  LinkReport report;
  link_media(group, images, MediaKind::Image, &Chunk::images, *rescue_strategy_, rescue_excluded, report);
  link_media(group, tables, MediaKind::Table, &Chunk::tables, *rescue_strategy_, rescue_excluded, report);
  return report;
}

MediaKeySet ReferenceLinker::cited_media(const std::string& text,
                                         const std::vector<PageImage>& images,
                                         const std::vector<PageTable>& tables) {
  MediaKeySet cited;
  auto collect = [&text, &cited](const auto& pool, MediaKind kind) {
    if (pool.empty()) {
      return;
    }
    const auto citations = find_citations(text, kind);
    for (const auto& item : pool) {
      const auto number = media_reference_number(id_of(item), caption_of(item), kind);
      if (number && std::find(citations.begin(), citations.end(), *number) != citations.end()) {
        cited.insert({kind, id_of(item)});
      }
    }
  };
  collect(images, MediaKind::Image);
  collect(tables, MediaKind::Table);
  return cited;
}

std::string ReferenceLinker::normalize_reference_number(const std::string& raw) {
  std::string number = raw;
  std::replace(number.begin(), number.end(), '_', '.');
  std::replace(number.begin(), number.end(), '-', '.');
  while (!number.empty() && (number.back() == '.' || number.back() == ',' || number.back() == ')')) {
    number.pop_back();
  }
  return number;
}

std::vector<std::string> ReferenceLinker::find_citations(const std::string& text, MediaKind kind) {
  const std::regex& re = kind == MediaKind::Image ? figure_citation_regex() : table_citation_regex();
  std::vector<std::string> citations;
  for (auto it = std::sregex_iterator(text.begin(), text.end(), re); it != std::sregex_iterator();
       ++it) {
    std::string number = normalize_reference_number((*it)[1].str());
    if (std::find(citations.begin(), citations.end(), number) == citations.end()) {
      citations.push_back(std::move(number));
    }
  }
  return citations;
}

std::optional<std::string> ReferenceLinker::media_reference_number(const std::string& media_id,
                                                                   const std::string& caption,
                                                                   MediaKind kind) {
  std::smatch m;
  const std::regex& id_re = kind == MediaKind::Image ? figure_id_regex() : table_id_regex();
  if (std::regex_search(media_id, m, id_re)) {
    return normalize_reference_number(m[1].str());
  }
  const auto caption_citations = find_citations(caption, kind);
  if (!caption_citations.empty()) {
    return caption_citations.front();
  }
  return std::nullopt;
}

}  // namespace folio_core
