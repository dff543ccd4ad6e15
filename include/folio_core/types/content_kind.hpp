#pragma once

#include <string>

namespace folio_core {

enum class ContentKind {
  Text,
  Definition,
  Theorem,
  Proof,
  Derivation,
  Example,
  Exercise,
  Solution,
  Table,
  Image,
  Formula
};

// Conversion utilities. Names are lower case ("text", "example", ...).
std::string to_string(ContentKind kind);
// Throws std::invalid_argument for unknown names.
ContentKind content_kind_from_string(const std::string& str);

enum class CollectionKind { Exercise, Example, Miscellaneous };

std::string to_string(CollectionKind kind);

// Exercise and Miscellaneous collections both hold exercise material.
ContentKind content_kind_for(CollectionKind kind);

}  // namespace folio_core
