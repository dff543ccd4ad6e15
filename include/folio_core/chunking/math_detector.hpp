#pragma once

#include <regex>
#include <string>
#include <vector>

#include "folio_core/types/chunk.hpp"

namespace folio_core {

/**
 * @brief Detects mathematical content in textbook text.
 *
 * Classifies standalone text into a ContentKind, pulls LaTeX equations out of
 * it and scores how math-heavy it is.
 */
class MathDetector {
 public:
  MathDetector();

  bool contains_math(const std::string& text) const;

  // Display equations ($$..$$, \[..\]) first, then inline ($..$, \(..\)).
  std::vector<EquationData> extract_equations(const std::string& text) const;

  // LaTeX commands weigh 5, symbols 2, equation bodies their length; the sum
  // is divided by the text length and capped at 1.
  double calculate_math_density(const std::string& text) const;

  // First match wins: definition, theorem, proof, derivation, example,
  // exercise, solution, otherwise text.
  ContentKind detect_content_kind(const std::string& text) const;

  bool is_proof(const std::string& text) const;
  bool is_derivation(const std::string& text) const;

 private:
  struct Span {
    size_t begin;
    size_t end;
    std::string body;
    bool is_display;
  };

  std::vector<Span> find_equation_spans(const std::string& text) const;
  size_t count_symbols(const std::string& text) const;

  std::regex latex_command_regex_;
  std::regex relation_regex_;
  std::regex fraction_regex_;
  std::vector<std::regex> display_regexes_;
  std::vector<std::regex> inline_regexes_;
  std::vector<std::regex> proof_indicators_;
  std::vector<std::regex> derivation_indicators_;
  std::regex definition_regex_;
  std::regex theorem_regex_;
  std::regex example_regex_;
  std::regex exercise_regex_;
  std::regex solution_regex_;
};

}  // namespace folio_core
