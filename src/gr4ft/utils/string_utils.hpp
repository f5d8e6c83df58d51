#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace gr4ft::util {

inline constexpr std::string_view k_whitespace = " \t\r\n";

inline std::string_view trim_view(std::string_view value) {
  size_t first = value.find_first_not_of(k_whitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  size_t last = value.find_last_not_of(k_whitespace);
  return value.substr(first, last - first + 1);
}

// split into lines on '\n'; the newline itself is not kept
inline std::vector<std::string_view> split_lines(std::string_view text) {
  std::vector<std::string_view> lines;
  size_t start = 0;
  while (start < text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string_view::npos) {
      lines.push_back(text.substr(start));
      break;
    }
    lines.push_back(text.substr(start, end - start));
    start = end + 1;
  }
  return lines;
}

} // namespace gr4ft::util
