#include "folio_core/chunking/header_patterns.hpp"

#include <cctype>
#include <regex>

namespace folio_core {

namespace {

const auto ICASE = std::regex_constants::ECMAScript | std::regex_constants::icase;

const std::regex& chapter_regex() {
  static const std::regex re(R"(^\s*CHAPTER\s+(\d+)\b[\s:.\-]*(.*)$)", ICASE);
  return re;
}

const std::regex& miscellaneous_regex() {
  static const std::regex re(R"(^\s*MISCELLANEOUS\s+(EXERCISES?|EXAMPLES?)\b)", ICASE);
  return re;
}

const std::regex& summary_regex() {
  static const std::regex re(R"(^\s*SUMMARY\b)", ICASE);
  return re;
}

const std::regex& exercise_regex() {
  static const std::regex re(R"(^\s*EXERCISE\s+(\d+(?:\.\d+)*))", ICASE);
  return re;
}

const std::regex& example_regex() {
  static const std::regex re(R"(^\s*EXAMPLE\s+(\d+(?:\.\d+)*))", ICASE);
  return re;
}

const std::regex& theorem_regex() {
  static const std::regex re(R"(^\s*(THEOREM|LEMMA|COROLLARY)\b\s*(\d+(?:\.\d+)*)?)", ICASE);
  return re;
}

const std::regex& definition_regex() {
  static const std::regex re(R"(^\s*DEFINITION\b\s*(\d+(?:\.\d+)*)?)", ICASE);
  return re;
}

// Section titles are recognised by their upper case, so this one is case sensitive.
const std::regex& section_regex() {
  static const std::regex re(R"(^\s*(\d+\.\d+)\s+([A-Z][A-Z0-9 ,'()\-]*[A-Z)])\s*$)",
                             std::regex_constants::ECMAScript);
  return re;
}

std::string trim(const std::string& s) {
  const auto begin = s.find_first_not_of(" \t\r");
  if (begin == std::string::npos) {
    return "";
  }
  const auto end = s.find_last_not_of(" \t\r");
  return s.substr(begin, end - begin + 1);
}

std::string capitalize(std::string word) {
  for (size_t i = 0; i < word.size(); ++i) {
    word[i] = static_cast<char>(i == 0 ? std::toupper(static_cast<unsigned char>(word[i]))
                                       : std::tolower(static_cast<unsigned char>(word[i])));
  }
  return word;
}

}  // namespace

std::string to_string(HeaderType type) {
  switch (type) {
    case HeaderType::Chapter:
      return "chapter";
    case HeaderType::Section:
      return "section";
    case HeaderType::Theorem:
      return "theorem";
    case HeaderType::Definition:
      return "definition";
    case HeaderType::Exercise:
      return "exercise";
    case HeaderType::Example:
      return "example";
    case HeaderType::Miscellaneous:
      return "miscellaneous";
    case HeaderType::Summary:
      return "summary";
  }
  return "unknown";
}

bool opens_collection(HeaderType type) {
  return type == HeaderType::Exercise || type == HeaderType::Example ||
         type == HeaderType::Miscellaneous;
}

std::optional<HeaderMatch> match_header_line(const std::string& raw_line) {
  std::string line = raw_line;
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }

  std::smatch m;
  HeaderMatch header{};
  header.length = raw_line.size();

  if (std::regex_search(line, m, chapter_regex())) {
    header.type = HeaderType::Chapter;
    header.number = m[1].str();
    header.title = trim(m[2].str());
    return header;
  }
  if (std::regex_search(line, m, miscellaneous_regex())) {
    header.type = HeaderType::Miscellaneous;
    const char third = static_cast<char>(std::tolower(static_cast<unsigned char>(m[1].str()[2])));
    header.subject = third == 'a' ? "Example" : "Exercise";
    return header;
  }
  if (std::regex_search(line, m, summary_regex())) {
    header.type = HeaderType::Summary;
    return header;
  }
  if (std::regex_search(line, m, exercise_regex())) {
    header.type = HeaderType::Exercise;
    header.number = m[1].str();
    return header;
  }
  if (std::regex_search(line, m, example_regex())) {
    header.type = HeaderType::Example;
    header.number = m[1].str();
    return header;
  }
  if (std::regex_search(line, m, theorem_regex())) {
    header.type = HeaderType::Theorem;
    header.title = capitalize(m[1].str());
    header.number = m[2].matched ? m[2].str() : "";
    return header;
  }
  if (std::regex_search(line, m, definition_regex())) {
    header.type = HeaderType::Definition;
    header.number = m[1].matched ? m[1].str() : "";
    return header;
  }
  if (std::regex_search(line, m, section_regex())) {
    header.type = HeaderType::Section;
    header.number = m[1].str();
    header.title = trim(m[2].str());
    return header;
  }
  return std::nullopt;
}

std::vector<HeaderMatch> find_headers(const std::string& text) {
  std::vector<HeaderMatch> headers;
  size_t line_start = 0;
  while (line_start < text.size()) {
    size_t line_end = text.find('\n', line_start);
    if (line_end == std::string::npos) {
      line_end = text.size();
    }
    auto header = match_header_line(text.substr(line_start, line_end - line_start));
    if (header) {
      header->offset = line_start;
      headers.push_back(*header);
    }
    line_start = line_end + 1;
  }
  return headers;
}

}  // namespace folio_core
