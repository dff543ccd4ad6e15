#include "folio_core/chunking/chunk_assembler.hpp"

#include <utf8.h>

#include <algorithm>
#include <iterator>
#include <regex>
#include <set>
#include <sstream>

namespace folio_core {

namespace {

std::string trim_block(const std::string& s) {
  const auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return "";
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

std::string join_paragraphs(const std::vector<CollectedParagraph>& paragraphs) {
  std::string joined;
  for (const auto& paragraph : paragraphs) {
    if (!joined.empty()) {
      joined += "\n\n";
    }
    joined += paragraph.text;
  }
  return joined;
}

}  // namespace

void OpenCollection::append_text(const std::string& text, int page_number) {
  for (auto& paragraph : ChunkAssembler::split_paragraphs(text)) {
    paragraphs.push_back({std::move(paragraph), page_number});
  }
}

void OpenCollection::add_page_media(const PageRecord& page) {
  for (const auto& image : page.images) {
    const bool present = std::any_of(images.begin(), images.end(), [&image](const PageImage& i) {
      return i.image_id == image.image_id;
    });
    if (!present) {
      images.push_back(image);
    }
  }
  for (const auto& table : page.tables) {
    const bool present = std::any_of(tables.begin(), tables.end(), [&table](const PageTable& t) {
      return t.table_id == table.table_id;
    });
    if (!present) {
      tables.push_back(table);
    }
  }
}

ContentKind OpenCollection::content_kind() const {
  return content_kind_for(kind == CollectionKind::Miscellaneous ? subject : kind);
}

std::string OpenCollection::text() const {
  return join_paragraphs(paragraphs);
}

std::vector<int> OpenCollection::pages() const {
  std::set<int> unique;
  for (const auto& paragraph : paragraphs) {
    unique.insert(paragraph.page_number);
  }
  unique.insert(media_only_pages.begin(), media_only_pages.end());
  if (unique.empty()) {
    unique.insert(start_page);
  }
  return {unique.begin(), unique.end()};
}

ChunkAssembler::ChunkAssembler(ChunkingConfig config, ReferenceLinker linker)
    : config_(config), linker_(std::move(linker)) {}

std::vector<std::string> ChunkAssembler::split_paragraphs(const std::string& text) {
  // One or more blank lines separate paragraphs
  static const std::regex paragraph_regex(R"(\n[ \t\r]*\n)");

  std::vector<std::string> paragraphs;
  auto it = std::sregex_token_iterator(text.begin(), text.end(), paragraph_regex, -1);
  for (; it != std::sregex_token_iterator(); ++it) {
    std::string paragraph = trim_block(it->str());
    if (!paragraph.empty()) {
      paragraphs.push_back(std::move(paragraph));
    }
  }
  return paragraphs;
}

std::vector<std::string> ChunkAssembler::hard_split(const std::string& raw, size_t max_bytes) {
  std::vector<std::string> out;
  if (raw.empty()) {
    return out;
  }

  // utf8::next throws on malformed input, so malformed sequences are replaced first
  std::string text;
  utf8::replace_invalid(raw.begin(), raw.end(), std::back_inserter(text));

  auto piece_start = text.begin();
  auto it = text.begin();
  while (it != text.end()) {
    auto next = it;
    utf8::next(next, text.end());
    if (static_cast<size_t>(next - piece_start) > max_bytes && it != piece_start) {
      out.emplace_back(piece_start, it);  // up to, but *not* including it
      piece_start = it;
    }
    it = next;
  }
  if (piece_start != text.end()) {
    out.emplace_back(piece_start, text.end());
  }
  return out;
}

std::string ChunkAssembler::continuation_header(CollectionKind kind,
                                                const std::optional<std::string>& label,
                                                int part_number) {
  std::string header = "[" + to_string(kind);
  if (label && !label->empty()) {
    header += " " + *label;
  }
  header += " (Part " + std::to_string(part_number) + ")]";
  return header;
}

size_t ChunkAssembler::estimate_tokens(const std::string& text) {
  std::istringstream stream(text);
  size_t words = static_cast<size_t>(
      std::distance(std::istream_iterator<std::string>(stream), std::istream_iterator<std::string>()));
  return static_cast<size_t>(static_cast<double>(words) * ChunkingConfig::TOKENS_PER_WORD_ESTIMATE);
}

Chunk ChunkAssembler::make_chunk(const std::string& text,
                                 ContentKind kind,
                                 int page_number,
                                 std::vector<int> page_numbers,
                                 const StructuralContext& context,
                                 const AssemblyContext& assembly) const {
  Chunk chunk;
  chunk.document_id = assembly.document_id;
  chunk.class_level = assembly.class_level;
  chunk.context = context;
  chunk.content_kind = kind;
  chunk.page_number = page_number;
  chunk.page_numbers = std::move(page_numbers);
  chunk.text_content = text;
  chunk.equations = math_detector_.extract_equations(text);
  chunk.char_count = text.size();
  chunk.token_count = estimate_tokens(text);
  chunk.math_density = math_detector_.calculate_math_density(text);
  return chunk;
}

AssembledGroup ChunkAssembler::assemble_collection(const OpenCollection& collection,
                                                   const AssemblyContext& assembly,
                                                   const MediaKeySet& rescue_excluded) const {
  AssembledGroup group;
  if (collection.paragraphs.empty()) {
    return group;
  }

  const size_t max_size = std::max<size_t>(config_.max_chunk_size, 1);

  // Greedy paragraph packing; oversized paragraphs become parts of their own
  std::vector<std::vector<CollectedParagraph>> parts;
  std::vector<CollectedParagraph> current;
  size_t current_size = 0;
  auto close_part = [&]() {
    if (!current.empty()) {
      parts.push_back(std::move(current));
      current.clear();
      current_size = 0;
    }
  };

  for (const auto& paragraph : collection.paragraphs) {
    if (paragraph.text.size() > max_size) {
      close_part();
      for (auto& piece : hard_split(paragraph.text, max_size)) {
        parts.push_back({CollectedParagraph{std::move(piece), paragraph.page_number}});
      }
      continue;
    }
    const size_t added = (current.empty() ? 0 : 2) + paragraph.text.size();
    if (!current.empty() && current_size + added > max_size) {
      close_part();
    }
    current_size += (current.empty() ? 0 : 2) + paragraph.text.size();
    current.push_back(paragraph);
  }
  close_part();

  const auto pages = collection.pages();
  const ContentKind kind = collection.content_kind();
  const int part_count = static_cast<int>(parts.size());

  for (int i = 0; i < part_count; ++i) {
    std::string text = join_paragraphs(parts[i]);
    const int part_number = i + 1;
    if (part_number > 1) {
      const std::string header = continuation_header(collection.kind, collection.label, part_number);
      if (text.rfind(header, 0) != 0) {
        text = header + "\n\n" + text;
      }
    }
    Chunk chunk = make_chunk(text, kind, parts[i].front().page_number, pages, collection.context,
                             assembly);
    chunk.label = collection.label;
    chunk.part_index = part_number;
    chunk.part_count = part_count;
    group.chunks.push_back(std::move(chunk));
  }

  group.link_report = linker_.link(group.chunks, collection.images, collection.tables, rescue_excluded);
  return group;
}

AssembledGroup ChunkAssembler::assemble_page_text(const std::string& text,
                                                  const PageRecord& page,
                                                  const StructuralContext& context,
                                                  const AssemblyContext& assembly,
                                                  const MediaKeySet& rescue_excluded) const {
  AssembledGroup group;
  const auto paragraphs = split_paragraphs(text);
  if (paragraphs.empty()) {
    return group;
  }

  std::vector<std::string> pieces;
  std::string current;
  size_t current_tokens = 0;
  for (const auto& paragraph : paragraphs) {
    const size_t paragraph_tokens = estimate_tokens(paragraph);
    if (!current.empty() && current_tokens + paragraph_tokens > config_.max_tokens) {
      pieces.push_back(std::move(current));
      current.clear();
      current_tokens = 0;
    }
    if (!current.empty()) {
      current += "\n\n";
    }
    current += paragraph;
    current_tokens += paragraph_tokens;
  }
  if (!current.empty()) {
    pieces.push_back(std::move(current));
  }

  for (const auto& piece : pieces) {
    group.chunks.push_back(make_chunk(piece, math_detector_.detect_content_kind(piece),
                                      page.page_number, {page.page_number}, context, assembly));
  }

  group.link_report = linker_.link(group.chunks, page.images, page.tables, rescue_excluded);
  return group;
}

}  // namespace folio_core
