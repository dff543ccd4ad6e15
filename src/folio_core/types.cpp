#include "folio_core/types.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace folio_core {

std::string to_string(ContentKind kind) {
  switch (kind) {
    case ContentKind::Text:
      return "text";
    case ContentKind::Definition:
      return "definition";
    case ContentKind::Theorem:
      return "theorem";
    case ContentKind::Proof:
      return "proof";
    case ContentKind::Derivation:
      return "derivation";
    case ContentKind::Example:
      return "example";
    case ContentKind::Exercise:
      return "exercise";
    case ContentKind::Solution:
      return "solution";
    case ContentKind::Table:
      return "table";
    case ContentKind::Image:
      return "image";
    case ContentKind::Formula:
      return "formula";
  }
  return "text";
}

ContentKind content_kind_from_string(const std::string& str) {
  if (str == "text")
    return ContentKind::Text;
  if (str == "definition")
    return ContentKind::Definition;
  if (str == "theorem")
    return ContentKind::Theorem;
  if (str == "proof")
    return ContentKind::Proof;
  if (str == "derivation")
    return ContentKind::Derivation;
  if (str == "example")
    return ContentKind::Example;
  if (str == "exercise")
    return ContentKind::Exercise;
  if (str == "solution")
    return ContentKind::Solution;
  if (str == "table")
    return ContentKind::Table;
  if (str == "image")
    return ContentKind::Image;
  if (str == "formula")
    return ContentKind::Formula;
  throw std::invalid_argument("Unknown content kind: " + str);
}

std::string to_string(CollectionKind kind) {
  switch (kind) {
    case CollectionKind::Exercise:
      return "Exercise";
    case CollectionKind::Example:
      return "Example";
    case CollectionKind::Miscellaneous:
      return "Miscellaneous";
  }
  return "Exercise";
}

ContentKind content_kind_for(CollectionKind kind) {
  return kind == CollectionKind::Example ? ContentKind::Example : ContentKind::Exercise;
}

std::optional<std::string> Chunk::example_number() const {
  if (content_kind == ContentKind::Example) {
    return label;
  }
  return std::nullopt;
}

std::optional<std::string> Chunk::exercise_number() const {
  if (content_kind == ContentKind::Exercise) {
    return label;
  }
  return std::nullopt;
}

std::string Chunk::full_context() const {
  std::ostringstream ss;
  ss << "Class " << class_level << " | Chapter " << context.chapter_number << ": "
     << context.chapter_name << "\n";
  if (!context.section_name.empty()) {
    ss << "Section: " << context.section_name << "\n";
  }
  std::string kind_name = to_string(content_kind);
  std::transform(kind_name.begin(), kind_name.end(), kind_name.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  ss << "Content Type: " << kind_name << "\n\n" << text_content;

  if (!equations.empty()) {
    ss << "\n\nEquations:";
    for (const auto& equation : equations) {
      ss << "\n  " << equation.latex;
    }
  }
  return ss.str();
}

}  // namespace folio_core
