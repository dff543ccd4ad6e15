#include "folio_core/chunking/segmenter.hpp"

#include <iostream>
#include <stdexcept>

#include "folio_core/chunking/chunk_id.hpp"

namespace folio_core {

namespace {

bool is_blank(const std::string& text) {
  return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::optional<int> parse_number(const std::string& digits) {
  try {
    return std::stoi(digits);
  } catch (const std::out_of_range&) {
    return std::nullopt;
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  }
}

}  // namespace

Segmenter::Segmenter(ChunkingConfig config, std::shared_ptr<const OrphanRescueStrategy> rescue_strategy)
    : assembler_(config, ReferenceLinker(std::move(rescue_strategy))) {}

SegmenterState Segmenter::begin_document(const std::string& document_id,
                                         const std::string& class_level) const {
  SegmenterState state;
  state.document_id = document_id;
  state.class_level = class_level;
  return state;
}

ChunkingResult Segmenter::chunk_document(const std::vector<PageRecord>& pages,
                                         const std::string& document_id,
                                         const std::string& class_level) const {
  std::cout << "Chunking document " << document_id << " (" << pages.size() << " pages)" << std::endl;

  ChunkingResult result;
  SegmenterState state = begin_document(document_id, class_level);
  for (size_t i = 0; i < pages.size(); ++i) {
    if (pages[i].page_number > 0) {
      process_page(state, pages[i], result);
    } else {
      PageRecord numbered = pages[i];
      numbered.page_number = static_cast<int>(i) + 1;
      for (auto& image : numbered.images) {
        image.page_number = numbered.page_number;
      }
      for (auto& table : numbered.tables) {
        table.page_number = numbered.page_number;
      }
      process_page(state, numbered, result);
    }
  }
  finish_document(state, result);

  std::cout << "Created " << result.chunks.size() << " chunks for " << document_id << " ("
            << result.diagnostics.collections_closed << " collections, "
            << result.diagnostics.dropped_media.size() << " dropped media)" << std::endl;
  return result;
}

void Segmenter::process_page(SegmenterState& state, const PageRecord& page, ChunkingResult& sink) const {
  const std::string& text = page.text;

  // Chapter numbers only move forward; a repeated or older "CHAPTER n" line is
  // a running head or a cross reference, not a new chapter.
  std::vector<HeaderMatch> headers;
  int chapter = state.context.chapter_number;
  for (auto& header : find_headers(text)) {
    if (header.type == HeaderType::Chapter) {
      const auto number = parse_number(header.number);
      if (!number || *number <= chapter) {
        continue;
      }
      chapter = *number;
    }
    headers.push_back(std::move(header));
  }

  // Citation wins over co-location across the whole page: media cited by any
  // segment, or by the collection carried in from earlier pages, is no orphan
  // for the other groups that see this page's media.
  std::string citing_text = text;
  if (state.collection) {
    citing_text += "\n" + state.collection->text();
  }
  const MediaKeySet page_cited = ReferenceLinker::cited_media(citing_text, page.images, page.tables);

  bool media_offered = false;
  size_t cursor = 0;
  for (const auto& header : headers) {
    media_offered |= handle_segment(state, page, text.substr(cursor, header.offset - cursor), page_cited, sink);
    close_collection(state, sink);
    apply_header(state, header, page.page_number);
    // The header line stays with the text that follows it
    cursor = header.offset;
  }
  media_offered |= handle_segment(state, page, text.substr(cursor), page_cited, sink);

  if (!media_offered) {
    handle_media_only_page(state, page, page_cited);
  }
}

bool Segmenter::handle_segment(SegmenterState& state,
                               const PageRecord& page,
                               const std::string& segment,
                               const MediaKeySet& page_cited,
                               ChunkingResult& sink) const {
  if (is_blank(segment)) {
    return false;
  }

  if (state.collection) {
    state.collection->append_text(segment, page.page_number);
    state.collection->add_page_media(page);
    state.collection->cited_on_pages.insert(page_cited.begin(), page_cited.end());
    return true;
  }

  MediaKeySet rescue_excluded = page_cited;
  rescue_excluded.insert(state.attached_media.begin(), state.attached_media.end());
  emit(state,
       assembler_.assemble_page_text(segment, page, state.context,
                                     {state.document_id, state.class_level}, rescue_excluded),
       sink);
  return true;
}

void Segmenter::handle_media_only_page(SegmenterState& state,
                                       const PageRecord& page,
                                       const MediaKeySet& page_cited) const {
  if (page.images.empty() && page.tables.empty()) {
    return;
  }

  // An open collection spans the page, so its citations may still claim the media
  if (state.collection) {
    state.collection->add_page_media(page);
    state.collection->media_only_pages.push_back(page.page_number);
    state.collection->cited_on_pages.insert(page_cited.begin(), page_cited.end());
    return;
  }

  for (const auto& image : page.images) {
    state.pending_drops.push_back({image.image_id, MediaKind::Image, page.page_number});
  }
  for (const auto& table : page.tables) {
    state.pending_drops.push_back({table.table_id, MediaKind::Table, page.page_number});
  }
}

void Segmenter::close_collection(SegmenterState& state, ChunkingResult& sink) const {
  if (!state.collection) {
    return;
  }

  OpenCollection collection = std::move(*state.collection);
  state.collection.reset();

  MediaKeySet rescue_excluded = collection.cited_on_pages;
  rescue_excluded.insert(state.attached_media.begin(), state.attached_media.end());
  AssembledGroup group = assembler_.assemble_collection(
      collection, {state.document_id, state.class_level}, rescue_excluded);
  std::cout << "Closed " << to_string(collection.kind) << " "
            << collection.label.value_or("(unlabelled)") << " from page " << collection.start_page
            << " into " << group.chunks.size() << " chunk(s)" << std::endl;
  sink.diagnostics.collections_closed++;
  emit(state, std::move(group), sink);
}

void Segmenter::apply_header(SegmenterState& state, const HeaderMatch& header, int page_number) const {
  auto open = [&](CollectionKind kind, std::optional<std::string> label) {
    OpenCollection collection;
    collection.kind = kind;
    collection.label = std::move(label);
    collection.start_page = page_number;
    collection.context = state.context;
    state.collection = std::move(collection);
  };

  switch (header.type) {
    case HeaderType::Chapter: {
      const int number = parse_number(header.number).value_or(state.context.chapter_number);
      state.context.chapter_number = number;
      state.context.chapter_name =
          header.title.empty() ? "Chapter " + std::to_string(number) : header.title;
      state.context.section_name.clear();
      break;
    }
    case HeaderType::Section:
      state.context.section_name = header.title;
      break;
    case HeaderType::Exercise:
      open(CollectionKind::Exercise, header.number);
      break;
    case HeaderType::Example:
      open(CollectionKind::Example, header.number);
      break;
    case HeaderType::Miscellaneous:
      open(CollectionKind::Miscellaneous, std::nullopt);
      state.collection->subject =
          header.subject == "Example" ? CollectionKind::Example : CollectionKind::Exercise;
      break;
    case HeaderType::Theorem:
    case HeaderType::Definition:
    case HeaderType::Summary:
      break;
  }
}

void Segmenter::emit(SegmenterState& state, AssembledGroup group, ChunkingResult& sink) const {
  for (auto& chunk : group.chunks) {
    chunk.sequence = state.next_sequence++;
    chunk.chunk_id = make_chunk_id(state.document_id, chunk.sequence, chunk.text_content);
    for (const auto& image : chunk.images) {
      state.attached_media.insert({MediaKind::Image, image.image_id});
    }
    for (const auto& table : chunk.tables) {
      state.attached_media.insert({MediaKind::Table, table.table_id});
    }
    sink.chunks.push_back(std::move(chunk));
  }
  for (auto& dropped : group.link_report.dropped) {
    state.pending_drops.push_back(std::move(dropped));
  }
}

void Segmenter::finish_document(SegmenterState& state, ChunkingResult& sink) const {
  close_collection(state, sink);

  MediaKeySet reported;
  for (const auto& dropped : state.pending_drops) {
    const MediaKey key{dropped.kind, dropped.media_id};
    if (state.attached_media.count(key) || !reported.insert(key).second) {
      continue;
    }
    std::cerr << "Warning: Dropping " << to_string(dropped.kind) << " " << dropped.media_id
              << " on page " << dropped.page_number << " of " << state.document_id
              << ": no citing or co-located chunk" << std::endl;
    sink.diagnostics.dropped_media.push_back(dropped);
  }
  state.pending_drops.clear();
}

}  // namespace folio_core
