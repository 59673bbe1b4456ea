#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "rag_core/types/block.hpp"

namespace rag_core {

/**
 * @brief Decodes the editor's serialized block tree.
 *
 * Missing or wrongly typed fields fall back to empty values. Inline text is the
 * trimmed concatenation of "text" items and the recursive text of "link" items.
 *
 * @return std::nullopt when the content is not a JSON array.
 */
std::optional<std::vector<Block>> parse_blocks(std::string_view content);

// Bookmark, file and folder blocks anywhere in the tree, in document order.
ExternalRefs extract_external_refs(const std::vector<Block>& blocks);
ExternalRefs extract_external_refs(std::string_view content);

// All block text in document order joined by single spaces, capped to max_chars code points.
std::string extract_plain_text(std::string_view content, size_t max_chars);

}  // namespace rag_core
