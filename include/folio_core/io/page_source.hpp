#pragma once

#include <exception>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "folio_core/types/page_record.hpp"

namespace folio_core {

class PageSourceError : public std::exception {
 public:
  explicit PageSourceError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Supplies the extracted pages of one document, in page order.
class PageSource {
 public:
  virtual ~PageSource() = default;
  virtual std::vector<PageRecord> pages() const = 0;
};

/**
 * @brief Pages encoded as JSON, either a bare array of page objects or an
 * object with a "pages" array.
 *
 * Individual pages are decoded leniently; only a document that is not valid
 * JSON or has no page array is an error.
 */
class JsonPageSource : public PageSource {
 public:
  explicit JsonPageSource(nlohmann::json document);

  static JsonPageSource from_file(const std::filesystem::path& path);

  std::vector<PageRecord> pages() const override;

 private:
  nlohmann::json pages_;
};

}  // namespace folio_core
