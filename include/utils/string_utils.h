#ifndef STRING_UTILS_H
#define STRING_UTILS_H

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace StringUtils {

inline std::string toLower(std::string_view str) {
  std::string result{str};
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return result;
}

inline std::string toUpper(std::string_view str) {
  std::string result{str};
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return result;
}

inline std::string trim(std::string_view str) {
  const auto start = std::find_if_not(
      str.begin(), str.end(), [](unsigned char c) { return std::isspace(c); });

  const auto end =
      std::find_if_not(str.rbegin(), str.rend(), [](unsigned char c) {
        return std::isspace(c);
      }).base();

  return (start < end) ? std::string(start, end) : std::string{};
}

inline bool startsWith(std::string_view str, std::string_view prefix) {
  return str.size() >= prefix.size() &&
         str.compare(0, prefix.size(), prefix) == 0;
}

inline bool endsWith(std::string_view str, std::string_view suffix) {
  return str.size() >= suffix.size() &&
         str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Splits on delimiter, trims every piece and drops empty ones.
inline std::vector<std::string> splitAndTrim(std::string_view str,
                                             char delimiter) {
  std::vector<std::string> parts;
  size_t start = 0;
  while (start <= str.size()) {
    size_t pos = str.find(delimiter, start);
    if (pos == std::string_view::npos)
      pos = str.size();
    std::string piece = trim(str.substr(start, pos - start));
    if (!piece.empty())
      parts.push_back(std::move(piece));
    start = pos + 1;
  }
  return parts;
}

// Shell-style glob match: '*' any run, '?' one character. SQL LIKE
// wildcards '%' and '_' are accepted as aliases.
inline bool globMatch(std::string_view pattern, std::string_view text) {
  size_t p = 0, t = 0;
  size_t starP = std::string_view::npos, starT = 0;

  while (t < text.size()) {
    if (p < pattern.size() &&
        (pattern[p] == '?' || pattern[p] == '_' || pattern[p] == text[t])) {
      ++p;
      ++t;
    } else if (p < pattern.size() && (pattern[p] == '*' || pattern[p] == '%')) {
      starP = p++;
      starT = t;
    } else if (starP != std::string_view::npos) {
      p = starP + 1;
      t = ++starT;
    } else {
      return false;
    }
  }

  while (p < pattern.size() && (pattern[p] == '*' || pattern[p] == '%'))
    ++p;
  return p == pattern.size();
}

// Parses sizes such as "10GB", "512MB", "1024" (bytes). Units are base 1024
// and the trailing 'B' is optional ("10G" == "10GB"). Throws
// std::invalid_argument on malformed input.
inline int64_t parseSizeBytes(std::string_view text) {
  std::string s = toUpper(trim(text));
  if (s.empty()) {
    throw std::invalid_argument("Size value is empty");
  }

  size_t digits = 0;
  while (digits < s.size() && std::isdigit(static_cast<unsigned char>(s[digits])))
    ++digits;
  if (digits == 0 || digits > 15) {
    throw std::invalid_argument("Invalid size value: " + std::string(text));
  }

  int64_t number = std::stoll(s.substr(0, digits));
  std::string unit = trim(s.substr(digits));

  int shift = 0;
  if (unit.empty() || unit == "B") {
    shift = 0;
  } else if (unit == "K" || unit == "KB") {
    shift = 10;
  } else if (unit == "M" || unit == "MB") {
    shift = 20;
  } else if (unit == "G" || unit == "GB") {
    shift = 30;
  } else if (unit == "T" || unit == "TB") {
    shift = 40;
  } else {
    throw std::invalid_argument("Unknown size unit in: " + std::string(text));
  }

  if (shift > 0 && number > (INT64_MAX >> shift)) {
    throw std::invalid_argument("Size value too large: " + std::string(text));
  }
  return number << shift;
}

} // namespace StringUtils

#endif
