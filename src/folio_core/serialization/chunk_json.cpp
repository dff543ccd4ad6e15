#include "folio_core/serialization/chunk_json.hpp"

#include <algorithm>

namespace folio_core {

namespace {

template <typename T>
T value_or(const nlohmann::json& j, const char* key, T fallback) {
  const auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return fallback;
  }
  try {
    return it->get<T>();
  } catch (const nlohmann::json::exception&) {
    return fallback;
  }
}

std::optional<BoundingBox> bbox_from(const nlohmann::json& j, const char* key) {
  const auto it = j.find(key);
  if (it == j.end()) {
    return std::nullopt;
  }
  if (it->is_array() && it->size() == 4 && std::all_of(it->begin(), it->end(), [](const nlohmann::json& v) {
        return v.is_number();
      })) {
    return BoundingBox{(*it)[0].get<double>(), (*it)[1].get<double>(), (*it)[2].get<double>(),
                       (*it)[3].get<double>()};
  }
  if (it->is_object()) {
    BoundingBox bbox;
    bbox.x0 = value_or<double>(*it, "x0", 0.0);
    bbox.y0 = value_or<double>(*it, "y0", 0.0);
    bbox.x1 = value_or<double>(*it, "x1", 0.0);
    bbox.y1 = value_or<double>(*it, "y1", 0.0);
    return bbox;
  }
  return std::nullopt;
}

}  // namespace

void to_json(nlohmann::json& j, const BoundingBox& bbox) {
  j = nlohmann::json::array({bbox.x0, bbox.y0, bbox.x1, bbox.y1});
}

void from_json(const nlohmann::json& j, BoundingBox& bbox) {
  if (j.is_array()) {
    bbox = BoundingBox{j.at(0).get<double>(), j.at(1).get<double>(), j.at(2).get<double>(),
                       j.at(3).get<double>()};
    return;
  }
  bbox.x0 = j.at("x0").get<double>();
  bbox.y0 = j.at("y0").get<double>();
  bbox.x1 = j.at("x1").get<double>();
  bbox.y1 = j.at("y1").get<double>();
}

void to_json(nlohmann::json& j, const PageImage& image) {
  j = nlohmann::json{{"image_id", image.image_id},
                     {"image_path", image.image_path},
                     {"caption", image.caption},
                     {"page_number", image.page_number}};
  j["bbox"] = image.bbox ? nlohmann::json(*image.bbox) : nlohmann::json(nullptr);
}

void from_json(const nlohmann::json& j, PageImage& image) {
  image.image_id = value_or<std::string>(j, "image_id", "");
  image.image_path = value_or<std::string>(j, "image_path", "");
  image.caption = value_or<std::string>(j, "caption", "");
  image.page_number = value_or<int>(j, "page_number", 0);
  image.bbox = bbox_from(j, "bbox");
}

void to_json(nlohmann::json& j, const PageTable& table) {
  j = nlohmann::json{{"table_id", table.table_id},
                     {"body", table.body},
                     {"page_number", table.page_number}};
  j["bbox"] = table.bbox ? nlohmann::json(*table.bbox) : nlohmann::json(nullptr);
}

void from_json(const nlohmann::json& j, PageTable& table) {
  table.table_id = value_or<std::string>(j, "table_id", "");
  // Extractors emit the markdown body under either name
  table.body = value_or<std::string>(j, "body", value_or<std::string>(j, "markdown", ""));
  table.page_number = value_or<int>(j, "page_number", 0);
  table.bbox = bbox_from(j, "bbox");
}

void to_json(nlohmann::json& j, const TextBlock& block) {
  j = nlohmann::json{{"text", block.text}, {"bbox", block.bbox}};
}

void from_json(const nlohmann::json& j, TextBlock& block) {
  block.text = value_or<std::string>(j, "text", "");
  block.bbox = bbox_from(j, "bbox").value_or(BoundingBox{});
}

void to_json(nlohmann::json& j, const EquationData& equation) {
  j = nlohmann::json{{"equation_id", equation.equation_id},
                     {"latex", equation.latex},
                     {"original_text", equation.original_text},
                     {"is_inline", equation.is_inline},
                     {"is_multiline", equation.is_multiline}};
}

void from_json(const nlohmann::json& j, EquationData& equation) {
  equation.equation_id = value_or<std::string>(j, "equation_id", "");
  equation.latex = value_or<std::string>(j, "latex", "");
  equation.original_text = value_or<std::string>(j, "original_text", "");
  equation.is_inline = value_or<bool>(j, "is_inline", true);
  equation.is_multiline = value_or<bool>(j, "is_multiline", false);
}

void to_json(nlohmann::json& j, const StructuralContext& context) {
  j = nlohmann::json{{"chapter_number", context.chapter_number},
                     {"chapter_name", context.chapter_name},
                     {"section_name", context.section_name}};
}

void to_json(nlohmann::json& j, const Chunk& chunk) {
  j = nlohmann::json{{"chunk_id", chunk.chunk_id},
                     {"document_id", chunk.document_id},
                     {"class_level", chunk.class_level},
                     {"sequence", chunk.sequence},
                     {"context", chunk.context},
                     {"content_kind", to_string(chunk.content_kind)},
                     {"page_number", chunk.page_number},
                     {"page_numbers", chunk.page_numbers},
                     {"text_content", chunk.text_content},
                     {"equations", chunk.equations},
                     {"images", chunk.images},
                     {"tables", chunk.tables},
                     {"part_index", chunk.part_index},
                     {"part_count", chunk.part_count},
                     {"char_count", chunk.char_count},
                     {"token_count", chunk.token_count},
                     {"math_density", chunk.math_density},
                     {"has_image", chunk.has_image()},
                     {"has_table", chunk.has_table()},
                     {"has_equation", chunk.has_equation()}};
  j["label"] = chunk.label ? nlohmann::json(*chunk.label) : nlohmann::json(nullptr);
}

void to_json(nlohmann::json& j, const RetrievalResult& result) {
  j = nlohmann::json{{"chunk", result.chunk}, {"score", result.score}, {"rank", result.rank}};
}

void to_json(nlohmann::json& j, const DocumentSummary& summary) {
  j = nlohmann::json{{"document_id", summary.document_id},
                     {"class_level", summary.class_level},
                     {"total_chunks", summary.total_chunks},
                     {"chapters", summary.chapters}};
}

void to_json(nlohmann::json& j, const PageRecord& page) {
  j = nlohmann::json{{"page_number", page.page_number},
                     {"text", page.text},
                     {"blocks", page.blocks},
                     {"images", page.images},
                     {"tables", page.tables}};
}

PageRecord page_record_from_json(const nlohmann::json& j) {
  PageRecord page;
  if (!j.is_object()) {
    return page;
  }
  page.page_number = value_or<int>(j, "page_number", 0);
  page.text = value_or<std::string>(j, "text", "");

  auto each_object = [&j](const char* key, auto&& fn) {
    const auto it = j.find(key);
    if (it == j.end() || !it->is_array()) {
      return;
    }
    for (const auto& entry : *it) {
      if (entry.is_object()) {
        fn(entry);
      }
    }
  };

  each_object("blocks", [&page](const nlohmann::json& entry) { page.blocks.push_back(entry.get<TextBlock>()); });
  each_object("images", [&page](const nlohmann::json& entry) {
    PageImage image = entry.get<PageImage>();
    if (image.page_number <= 0) {
      image.page_number = page.page_number;
    }
    page.images.push_back(std::move(image));
  });
  each_object("tables", [&page](const nlohmann::json& entry) {
    PageTable table = entry.get<PageTable>();
    if (table.page_number <= 0) {
      table.page_number = page.page_number;
    }
    page.tables.push_back(std::move(table));
  });
  return page;
}

nlohmann::json chunk_payload_to_json(const Chunk& chunk) {
  return nlohmann::json{{"page_numbers", chunk.page_numbers},
                        {"equations", chunk.equations},
                        {"images", chunk.images},
                        {"tables", chunk.tables}};
}

void chunk_payload_from_json(const nlohmann::json& j, Chunk& chunk) {
  chunk.page_numbers = value_or<std::vector<int>>(j, "page_numbers", {});
  chunk.equations = value_or<std::vector<EquationData>>(j, "equations", {});
  chunk.images = value_or<std::vector<PageImage>>(j, "images", {});
  chunk.tables = value_or<std::vector<PageTable>>(j, "tables", {});
}

}  // namespace folio_core
