#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace rag_core {
namespace text {

// Replaces invalid UTF-8 sequences so the other helpers can rely on valid input.
std::string sanitize_utf8(std::string_view s);

// Length in code points.
size_t char_length(std::string_view s);

// First / last n code points.
std::string head_chars(std::string_view s, size_t n);
std::string tail_chars(std::string_view s, size_t n);

std::string trim(std::string_view s);

std::string join(const std::vector<std::string>& parts, std::string_view separator);

std::vector<std::string> split(std::string_view s, std::string_view separator);

// Splits on runs of terminal punctuation (。？！.?!), keeping each run attached
// to the text before it. A trailing fragment without punctuation is kept.
std::vector<std::string> split_sentences(std::string_view s);

std::string to_lower(std::string_view s);

// Single-line rendering for log output, cut to max_chars code points.
std::string preview(std::string_view s, size_t max_chars);

}  // namespace text
}  // namespace rag_core
