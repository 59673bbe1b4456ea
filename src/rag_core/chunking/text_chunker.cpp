#include "rag_core/chunking/text_chunker.hpp"

#include "rag_core/utils/text_utils.hpp"

namespace rag_core {

std::vector<std::string> split_long_text(std::string_view input, const ChunkConfig& config) {
  std::vector<std::string> result;
  if (config.max_chunk_size <= 0) {
    result.push_back(text::trim(input));
    return result;
  }
  const size_t max_size = static_cast<size_t>(config.max_chunk_size);
  const size_t overlap = config.overlap > 0 ? static_cast<size_t>(config.overlap) : 0;

  std::string current;
  size_t current_len = 0;
  for (const auto& sentence : text::split_sentences(input)) {
    const size_t sentence_len = text::char_length(sentence);
    if (current_len > 0 && current_len + sentence_len > max_size) {
      result.push_back(text::trim(current));
      current = overlap > 0 ? text::tail_chars(current, overlap) : std::string();
      current_len = text::char_length(current);
    }
    current += sentence;
    current_len += sentence_len;
  }
  if (current_len > 0) {
    result.push_back(text::trim(current));
  }
  return result;
}

ExtractedBlocks chunk_text_content(std::string_view input,
                                   const std::string& heading_context,
                                   const std::string& base_id,
                                   const std::string& block_type,
                                   const ChunkConfig& config) {
  const std::string clean = text::sanitize_utf8(input);
  if (text::trim(clean).empty()) {
    return {};
  }

  std::vector<std::string> paragraphs;
  for (const auto& part : text::split(clean, "\n\n")) {
    std::string p = text::trim(part);
    if (!p.empty()) {
      paragraphs.push_back(std::move(p));
    }
  }

  const size_t max_chunk = config.max_chunk_size > 0 ? static_cast<size_t>(config.max_chunk_size) : 0;
  const size_t max_merged = config.max_merged_length > 0 ? static_cast<size_t>(config.max_merged_length) : 0;

  std::vector<std::string> chunks;
  std::string current;
  size_t current_len = 0;

  auto flush = [&]() {
    if (current_len > 0) {
      chunks.push_back(text::trim(current));
    }
    current.clear();
    current_len = 0;
  };

  for (const auto& para : paragraphs) {
    const size_t para_len = text::char_length(para);
    if (max_chunk > 0 && para_len > max_chunk) {
      flush();
      for (auto& piece : split_long_text(para, config)) {
        chunks.push_back(std::move(piece));
      }
      continue;
    }

    size_t new_len = current_len + para_len;
    if (current_len > 0)
      new_len += 2;

    if (current_len == 0 || new_len <= max_merged) {
      if (current_len > 0)
        current += "\n\n";
      current += para;
      current_len = new_len;
    } else {
      flush();
      current = para;
      current_len = para_len;
    }
  }
  flush();

  ExtractedBlocks result;
  for (size_t i = 0; i < chunks.size(); ++i) {
    if (chunks[i].empty())
      continue;
    ExtractedBlock block;
    block.id = base_id + "_chunk_" + std::to_string(i);
    block.type = block_type;
    block.content = chunks[i];
    block.heading_context = heading_context;
    result.push_back(std::move(block));
  }
  return result;
}

}  // namespace rag_core
