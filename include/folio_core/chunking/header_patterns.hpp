#pragma once

#include <optional>
#include <string>
#include <vector>

namespace folio_core {

enum class HeaderType { Chapter, Section, Theorem, Definition, Exercise, Example, Miscellaneous, Summary };

std::string to_string(HeaderType type);

struct HeaderMatch {
  HeaderType type;
  // Byte offset of the header line within the page text
  size_t offset = 0;
  size_t length = 0;
  // Chapter number, exercise/example number, theorem number
  std::string number;
  // Chapter name or section title, when the header carries one
  std::string title;
  // Miscellaneous headers only: "Exercise" or "Example"
  std::string subject;
};

// Returns true for header types that open a new collection.
bool opens_collection(HeaderType type);

/**
 * @brief Finds structural headers at the start of lines in page text.
 *
 * Each line is tested against every family; a line yields at most one match
 * (the first family in priority order: chapter, miscellaneous, summary,
 * exercise, example, theorem, definition, section). Results are sorted by
 * offset.
 */
std::vector<HeaderMatch> find_headers(const std::string& text);

// Tests a single line. Leading whitespace is allowed.
std::optional<HeaderMatch> match_header_line(const std::string& line);

}  // namespace folio_core
