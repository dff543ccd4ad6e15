#pragma once

#include <optional>
#include <string>
#include <vector>

namespace folio_core {

struct BoundingBox {
  double x0 = 0.0;
  double y0 = 0.0;
  double x1 = 0.0;
  double y1 = 0.0;
};

struct TextBlock {
  std::string text;
  BoundingBox bbox;
};

struct PageImage {
  std::string image_id;
  std::string image_path;
  std::optional<BoundingBox> bbox;
  std::string caption;
  int page_number = 0;
};

struct PageTable {
  std::string table_id;
  // Markdown rendering of the table
  std::string body;
  std::optional<BoundingBox> bbox;
  int page_number = 0;
};

// One extracted page. Produced by a PageSource and never modified afterwards.
struct PageRecord {
  int page_number = 0;
  std::string text;
  std::vector<TextBlock> blocks;
  std::vector<PageImage> images;
  std::vector<PageTable> tables;
};

}  // namespace folio_core
