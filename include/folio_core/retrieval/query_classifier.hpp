#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace folio_core {

enum class QueryIntent { Definition, Theorem, Formula, Example, Exercise, Concept };

std::string to_string(QueryIntent intent);

class QueryClassifier {
 public:
  explicit QueryClassifier(int range_cap = 10);

  /**
   * @brief Maps a query to an intent.
   *
   * Explicit example/exercise numbers decide first; otherwise the first
   * keyword family found in the lower-cased query wins, defaulting to Concept.
   */
  QueryIntent classify(const std::string& query) const;

  // "examples 2 to 5", "example 2-5" -> {"2", "3", "4", "5"}. Reversed bounds
  // are swapped and the span is capped at range_cap.
  std::optional<std::vector<std::string>> extract_example_range(const std::string& query) const;

  // "example 5", "Ex. 3.2"
  std::optional<std::string> extract_example_number(const std::string& query) const;

  // "exercise 3.1", "question 4", "problem 2", "q 7"
  std::optional<std::string> extract_entity_number(const std::string& query) const;

  // True when the query names an example/exercise/question/problem number.
  static bool is_entity_query(const std::string& query);

 private:
  int range_cap_;
  std::vector<std::pair<QueryIntent, std::vector<std::string>>> keyword_families_;
};

}  // namespace folio_core
