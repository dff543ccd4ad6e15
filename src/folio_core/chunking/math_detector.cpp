#include "folio_core/chunking/math_detector.hpp"

#include <algorithm>
#include <array>
#include <iterator>
#include <string_view>

namespace folio_core {

namespace {

const auto ICASE = std::regex_constants::ECMAScript | std::regex_constants::icase;

// UTF-8 encoded; counted by substring search since std::regex works on bytes.
constexpr std::array<std::string_view, 39> MATH_SYMBOLS = {
    "∫", "∑", "∏", "√", "∞", "∂", "∇", "α", "β", "γ", "δ", "θ", "λ",
    "μ", "σ", "π", "ω", "≤", "≥", "≠", "≈", "∈", "∉", "⊂", "⊃", "∪",
    "∩", "×", "÷", "±", "∓", "→", "←", "↔", "⇒", "⇐", "⇔", "∆", "°"};

bool any_match(const std::vector<std::regex>& patterns, const std::string& text) {
  return std::any_of(patterns.begin(), patterns.end(),
                     [&text](const std::regex& re) { return std::regex_search(text, re); });
}

}  // namespace

MathDetector::MathDetector()
    : latex_command_regex_(
          R"(\\(int|sum|prod|lim|frac|sqrt|partial|nabla|infty|alpha|beta|gamma|delta|theta|lambda|mu|sigma|pi|omega|sin|cos|tan|log|ln|exp|det|dim|ker|max|min)(?![A-Za-z]))"),
      relation_regex_(R"([a-zA-Z]\s*[=<>])"),
      fraction_regex_(R"(\d+/\d+)"),
      display_regexes_{std::regex(R"(\$\$([\s\S]*?)\$\$)"), std::regex(R"(\\\[([\s\S]*?)\\\])")},
      inline_regexes_{std::regex(R"(\$([^$\n]+?)\$)"), std::regex(R"(\\\((.*?)\\\))")},
      proof_indicators_{std::regex(R"(\bproof\b)", ICASE),
                        std::regex(R"(\bprove\b)", ICASE),
                        std::regex(R"(\bQ\.E\.D\b)", ICASE),
                        std::regex(R"(\btherefore\b)", ICASE),
                        std::regex(R"(\bhence\b)", ICASE),
                        std::regex(R"(\bthus\b)", ICASE),
                        std::regex(R"(\blet us prove\b)", ICASE),
                        std::regex(R"(\bwe shall prove\b)", ICASE),
                        std::regex(R"(\bsolution\b)", ICASE)},
      derivation_indicators_{std::regex(R"(\bderive\b)", ICASE),
                             std::regex(R"(\bderivation\b)", ICASE),
                             std::regex(R"(\bderivative\b)", ICASE),
                             std::regex(R"(\bstep \d+\b)", ICASE),
                             std::regex(R"(\bfrom\b.*\bwe get\b)", ICASE),
                             std::regex(R"(\bsubstituting\b)", ICASE),
                             std::regex(R"(\bsolving\b)", ICASE),
                             std::regex(R"(\bsimplifying\b)", ICASE)},
      definition_regex_(R"(\bdefinition\b|\bdefine\b|\bdef\.)", ICASE),
      theorem_regex_(R"(\btheorem\b|\bthm\.|\blemma\b|\bcorollary\b)", ICASE),
      example_regex_(R"(\bexample\b|\bex\.)", ICASE),
      exercise_regex_(R"(\bexercise\b|\bquestion\b|\bq\.|\bproblem\b)", ICASE),
      solution_regex_(R"(\bsolution\b|\bsol\.|\banswer\b)", ICASE) {}

bool MathDetector::contains_math(const std::string& text) const {
  if (text.empty()) {
    return false;
  }
  return std::regex_search(text, latex_command_regex_) || count_symbols(text) > 0 ||
         std::regex_search(text, relation_regex_) || std::regex_search(text, fraction_regex_);
}

std::vector<MathDetector::Span> MathDetector::find_equation_spans(const std::string& text) const {
  std::vector<Span> spans;
  auto overlaps = [&spans](size_t begin, size_t end) {
    return std::any_of(spans.begin(), spans.end(),
                       [&](const Span& s) { return begin < s.end && s.begin < end; });
  };

  for (const auto& re : display_regexes_) {
    for (auto it = std::sregex_iterator(text.begin(), text.end(), re); it != std::sregex_iterator();
         ++it) {
      const size_t begin = static_cast<size_t>(it->position());
      const size_t end = begin + static_cast<size_t>(it->length());
      if (!overlaps(begin, end)) {
        spans.push_back({begin, end, (*it)[1].str(), true});
      }
    }
  }
  // Inline delimiters inside an already-found display equation are not equations of their own
  for (const auto& re : inline_regexes_) {
    for (auto it = std::sregex_iterator(text.begin(), text.end(), re); it != std::sregex_iterator();
         ++it) {
      const size_t begin = static_cast<size_t>(it->position());
      const size_t end = begin + static_cast<size_t>(it->length());
      if (!overlaps(begin, end)) {
        spans.push_back({begin, end, (*it)[1].str(), false});
      }
    }
  }
  return spans;
}

std::vector<EquationData> MathDetector::extract_equations(const std::string& text) const {
  std::vector<EquationData> equations;
  int equation_id = 0;
  for (const auto& span : find_equation_spans(text)) {
    EquationData equation;
    equation.equation_id = "eq_" + std::to_string(++equation_id);
    const auto first = span.body.find_first_not_of(" \t\r\n");
    const auto last = span.body.find_last_not_of(" \t\r\n");
    equation.latex = first == std::string::npos ? "" : span.body.substr(first, last - first + 1);
    equation.original_text = text.substr(span.begin, span.end - span.begin);
    equation.is_inline = !span.is_display;
    equation.is_multiline = span.is_display && (span.body.find('\n') != std::string::npos ||
                                                span.body.find("\\\\") != std::string::npos);
    equations.push_back(std::move(equation));
  }
  return equations;
}

size_t MathDetector::count_symbols(const std::string& text) const {
  size_t count = 0;
  for (const auto symbol : MATH_SYMBOLS) {
    for (size_t pos = text.find(symbol); pos != std::string::npos;
         pos = text.find(symbol, pos + symbol.size())) {
      ++count;
    }
  }
  return count;
}

double MathDetector::calculate_math_density(const std::string& text) const {
  if (text.empty()) {
    return 0.0;
  }

  size_t math_chars = 0;
  const auto commands = std::distance(
      std::sregex_iterator(text.begin(), text.end(), latex_command_regex_), std::sregex_iterator());
  math_chars += static_cast<size_t>(commands) * 5;
  math_chars += count_symbols(text) * 2;
  for (const auto& span : find_equation_spans(text)) {
    math_chars += span.body.size();
  }

  return std::min(static_cast<double>(math_chars) / static_cast<double>(text.size()), 1.0);
}

bool MathDetector::is_proof(const std::string& text) const {
  return any_match(proof_indicators_, text);
}

bool MathDetector::is_derivation(const std::string& text) const {
  if (any_match(derivation_indicators_, text)) {
    return true;
  }
  // Multi-step equation chains
  return std::count(text.begin(), text.end(), '=') >= 3;
}

ContentKind MathDetector::detect_content_kind(const std::string& text) const {
  if (std::regex_search(text, definition_regex_)) {
    return ContentKind::Definition;
  }
  if (std::regex_search(text, theorem_regex_)) {
    return ContentKind::Theorem;
  }
  if (is_proof(text)) {
    return ContentKind::Proof;
  }
  if (is_derivation(text)) {
    return ContentKind::Derivation;
  }
  if (std::regex_search(text, example_regex_)) {
    return ContentKind::Example;
  }
  if (std::regex_search(text, exercise_regex_)) {
    return ContentKind::Exercise;
  }
  if (std::regex_search(text, solution_regex_)) {
    return ContentKind::Solution;
  }
  return ContentKind::Text;
}

}  // namespace folio_core
