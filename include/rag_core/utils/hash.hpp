#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace rag_core {

// Lowercase hex SHA-256 of the input.
std::string sha256_hex(std::string_view data);

// First 16 hex characters of the SHA-256. Used as the skip-vs-reembed signal.
std::string hash_content(std::string_view content);

/**
 * @brief Content-addressed identity of a synthetic chunk.
 *
 * The ID is "agg_" followed by the first 8 bytes (16 hex characters) of the
 * SHA-256 of the ordered member IDs joined with '|'. The same members in the
 * same order always produce the same ID, which is what keeps re-indexing of
 * unchanged documents free of embedding calls.
 */
std::string aggregated_id(const std::vector<std::string>& member_ids);

inline bool is_aggregated_id(std::string_view id) {
  return id.rfind("agg_", 0) == 0;
}

}  // namespace rag_core
