#include "rag_core/utils/text_utils.hpp"

#include <utf8.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iterator>

namespace rag_core {
namespace text {

namespace {

bool is_terminal_punctuation(uint32_t cp) {
  switch (cp) {
    case '.':
    case '?':
    case '!':
    case 0x3002:  // 。
    case 0xFF1F:  // ？
    case 0xFF01:  // ！
      return true;
    default:
      return false;
  }
}

bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

}  // namespace

std::string sanitize_utf8(std::string_view s) {
  if (utf8::is_valid(s.begin(), s.end())) {
    return std::string(s);
  }
  std::string out;
  utf8::replace_invalid(s.begin(), s.end(), std::back_inserter(out));
  return out;
}

size_t char_length(std::string_view s) {
  return static_cast<size_t>(utf8::distance(s.begin(), s.end()));
}

std::string head_chars(std::string_view s, size_t n) {
  auto it = s.begin();
  for (size_t i = 0; i < n && it != s.end(); ++i) {
    utf8::next(it, s.end());
  }
  return std::string(s.begin(), it);
}

std::string tail_chars(std::string_view s, size_t n) {
  auto it = s.end();
  for (size_t i = 0; i < n && it != s.begin(); ++i) {
    utf8::prior(it, s.begin());
  }
  return std::string(it, s.end());
}

std::string trim(std::string_view s) {
  size_t start = 0;
  while (start < s.size() && is_space(s[start]))
    ++start;
  size_t end = s.size();
  while (end > start && is_space(s[end - 1]))
    --end;
  return std::string(s.substr(start, end - start));
}

std::string join(const std::vector<std::string>& parts, std::string_view separator) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0)
      out.append(separator);
    out.append(parts[i]);
  }
  return out;
}

std::vector<std::string> split(std::string_view s, std::string_view separator) {
  std::vector<std::string> parts;
  if (separator.empty()) {
    parts.emplace_back(s);
    return parts;
  }
  size_t start = 0;
  while (true) {
    size_t pos = s.find(separator, start);
    if (pos == std::string_view::npos) {
      parts.emplace_back(s.substr(start));
      break;
    }
    parts.emplace_back(s.substr(start, pos - start));
    start = pos + separator.size();
  }
  return parts;
}

std::vector<std::string> split_sentences(std::string_view s) {
  std::vector<std::string> sentences;
  auto it = s.begin();
  auto segment_start = it;

  while (it != s.end()) {
    auto cp_start = it;
    uint32_t cp = utf8::next(it, s.end());
    if (!is_terminal_punctuation(cp)) {
      continue;
    }
    // Consume the whole punctuation run.
    auto run_end = it;
    while (run_end != s.end()) {
      auto probe = run_end;
      if (!is_terminal_punctuation(utf8::next(probe, s.end())))
        break;
      run_end = probe;
    }
    // A run with no text in front of it is dropped together with the run.
    if (cp_start != segment_start) {
      sentences.emplace_back(segment_start, run_end);
    }
    it = run_end;
    segment_start = run_end;
  }

  if (segment_start != s.end()) {
    sentences.emplace_back(segment_start, s.end());
  }
  return sentences;
}

std::string to_lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string preview(std::string_view s, size_t max_chars) {
  std::string flat;
  flat.reserve(s.size());
  for (char c : s) {
    if (c == '\n') {
      flat += "\u21b5 ";
    } else {
      flat += c;
    }
  }
  if (char_length(flat) > max_chars) {
    return head_chars(flat, max_chars) + "...";
  }
  return flat;
}

}  // namespace text
}  // namespace rag_core
