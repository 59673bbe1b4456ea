#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "rag_core/types/chunk.hpp"

namespace rag_core {

/**
 * @brief Splits text longer than max_chunk_size at sentence boundaries.
 *
 * Each piece after the first starts with the last `overlap` characters of the
 * previous piece. Pieces are trimmed.
 */
std::vector<std::string> split_long_text(std::string_view text, const ChunkConfig& config);

/**
 * @brief Paragraph-based chunking for raw external content (bookmarks, files, folders).
 *
 * Paragraphs are separated by blank lines. Short paragraphs are joined with a
 * blank line up to max_merged_length; paragraphs longer than max_chunk_size are
 * sentence-split with overlap. Chunk IDs are "{base_id}_chunk_{i}".
 *
 * @return An empty vector when the text has no non-blank content.
 */
ExtractedBlocks chunk_text_content(std::string_view text,
                                   const std::string& heading_context,
                                   const std::string& base_id,
                                   const std::string& block_type,
                                   const ChunkConfig& config);

}  // namespace rag_core
