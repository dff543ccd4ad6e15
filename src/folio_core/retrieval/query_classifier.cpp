#include "folio_core/retrieval/query_classifier.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace folio_core {

namespace {

const auto ICASE = std::regex_constants::ECMAScript | std::regex_constants::icase;

const std::regex& range_regex() {
  static const std::regex re(R"(\bexamples?\s+(\d+)\s*(?:to|-)\s*(\d+))", ICASE);
  return re;
}

const std::vector<std::regex>& example_number_regexes() {
  static const std::vector<std::regex> patterns = {
      std::regex(R"(\bexample\s+(\d+(?:\.\d+)?))", ICASE),
      std::regex(R"(\bex\.\s*(\d+(?:\.\d+)?))", ICASE),
  };
  return patterns;
}

const std::regex& entity_number_regex() {
  static const std::regex re(R"(\b(?:exercise|question|problem|q)\.?\s*(\d+(?:\.\d+)?))", ICASE);
  return re;
}

const std::regex& entity_query_regex() {
  static const std::regex re(R"(\b(?:example|ex|exercise|question|q|problem)\.?\s*\d+)", ICASE);
  return re;
}

std::string to_lower(const std::string& text) {
  std::string lowered = text;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

}  // namespace

std::string to_string(QueryIntent intent) {
  switch (intent) {
    case QueryIntent::Definition:
      return "definition";
    case QueryIntent::Theorem:
      return "theorem";
    case QueryIntent::Formula:
      return "formula";
    case QueryIntent::Example:
      return "example";
    case QueryIntent::Exercise:
      return "exercise";
    case QueryIntent::Concept:
      return "concept";
  }
  return "concept";
}

QueryClassifier::QueryClassifier(int range_cap)
    : range_cap_(range_cap),
      keyword_families_{
          {QueryIntent::Definition, {"what is", "define", "meaning of", "definition"}},
          {QueryIntent::Theorem, {"theorem", "prove", "proof"}},
          {QueryIntent::Formula, {"formula", "equation", "expression"}},
          {QueryIntent::Example, {"example", "demonstrate", "illustrate"}},
          {QueryIntent::Exercise, {"solve", "exercise", "problem", "question"}},
          {QueryIntent::Concept, {"explain", "how", "why", "concept"}},
      } {}

QueryIntent QueryClassifier::classify(const std::string& query) const {
  if (extract_example_range(query) || extract_example_number(query)) {
    return QueryIntent::Example;
  }
  if (extract_entity_number(query)) {
    return QueryIntent::Exercise;
  }

  const std::string lowered = to_lower(query);
  for (const auto& [intent, keywords] : keyword_families_) {
    for (const auto& keyword : keywords) {
      if (lowered.find(keyword) != std::string::npos) {
        return intent;
      }
    }
  }
  return QueryIntent::Concept;
}

std::optional<std::vector<std::string>> QueryClassifier::extract_example_range(
    const std::string& query) const {
  std::smatch m;
  if (!std::regex_search(query, m, range_regex())) {
    return std::nullopt;
  }

  long start = 0;
  long end = 0;
  try {
    start = std::stol(m[1].str());
    end = std::stol(m[2].str());
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
  if (end < start) {
    std::swap(start, end);
  }
  if (end - start > range_cap_) {
    end = start + range_cap_;
  }

  std::vector<std::string> numbers;
  for (long i = start; i <= end; ++i) {
    numbers.push_back(std::to_string(i));
  }
  return numbers;
}

std::optional<std::string> QueryClassifier::extract_example_number(const std::string& query) const {
  std::smatch m;
  for (const auto& pattern : example_number_regexes()) {
    if (std::regex_search(query, m, pattern)) {
      return m[1].str();
    }
  }
  return std::nullopt;
}

std::optional<std::string> QueryClassifier::extract_entity_number(const std::string& query) const {
  std::smatch m;
  if (std::regex_search(query, m, entity_number_regex())) {
    return m[1].str();
  }
  return std::nullopt;
}

bool QueryClassifier::is_entity_query(const std::string& query) {
  return std::regex_search(query, entity_query_regex());
}

}  // namespace folio_core
