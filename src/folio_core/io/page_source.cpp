#include "folio_core/io/page_source.hpp"

#include <fstream>

#include "folio_core/serialization/chunk_json.hpp"

namespace folio_core {

JsonPageSource::JsonPageSource(nlohmann::json document) {
  if (document.is_object() && document.contains("pages")) {
    pages_ = std::move(document["pages"]);
  } else {
    pages_ = std::move(document);
  }
  if (!pages_.is_array()) {
    throw PageSourceError("Page document must contain an array of pages");
  }
}

JsonPageSource JsonPageSource::from_file(const std::filesystem::path& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw PageSourceError("Could not open page file: " + path.string());
  }
  try {
    return JsonPageSource(nlohmann::json::parse(file));
  } catch (const nlohmann::json::parse_error& e) {
    throw PageSourceError("Invalid JSON in page file " + path.string() + ": " + e.what());
  }
}

std::vector<PageRecord> JsonPageSource::pages() const {
  std::vector<PageRecord> pages;
  pages.reserve(pages_.size());
  for (const auto& entry : pages_) {
    pages.push_back(page_record_from_json(entry));
  }
  return pages;
}

}  // namespace folio_core
