// Small string helpers shared by the line-oriented parsers

#ifndef FLOWGRID_TEXT_HPP
#define FLOWGRID_TEXT_HPP

#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace flowgrid::text {

inline bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

inline std::string_view trim(std::string_view s) {
  while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
  while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
  return s;
}

inline std::string_view rtrim(std::string_view s) {
  while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
  return s;
}

inline std::string to_upper(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return out;
}

inline std::string to_lower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

inline bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::toupper(static_cast<unsigned char>(a[i])) != std::toupper(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

inline std::vector<std::string> split_ws(std::string_view s) {
  std::vector<std::string> parts;
  std::size_t i = 0;
  while (i < s.size()) {
    while (i < s.size() && is_space(s[i])) ++i;
    std::size_t start = i;
    while (i < s.size() && !is_space(s[i])) ++i;
    if (i > start) parts.emplace_back(s.substr(start, i - start));
  }
  return parts;
}

/**
 * @brief Match a (possibly multi-word) keyword at the start of a line
 * @param line Line to test; leading whitespace is ignored
 * @param keyword Upper-case keyword, words separated by single spaces (e.g. "LOAD CSV")
 * @param rest If non-null, receives the text after the keyword with leading whitespace removed
 * @return true when every keyword word matches case-insensitively and the last word
 *         ends at a whitespace character or the end of the line
 */
inline bool match_keyword(std::string_view line, std::string_view keyword, std::string_view* rest = nullptr) {
  std::string_view s = trim(line);
  std::size_t pos = 0;
  std::size_t k = 0;
  while (k < keyword.size()) {
    if (keyword[k] == ' ') {
      if (pos >= s.size() || !is_space(s[pos])) return false;
      while (pos < s.size() && is_space(s[pos])) ++pos;
      ++k;
      continue;
    }
    if (pos >= s.size() ||
        std::toupper(static_cast<unsigned char>(s[pos])) != static_cast<unsigned char>(keyword[k])) {
      return false;
    }
    ++pos;
    ++k;
  }
  if (pos < s.size() && !is_space(s[pos])) return false;
  if (rest) {
    *rest = trim(s.substr(pos));
  }
  return true;
}

}  // namespace flowgrid::text

#endif  // FLOWGRID_TEXT_HPP
