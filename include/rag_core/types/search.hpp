#pragma once

#include <optional>
#include <string>
#include <vector>

namespace rag_core {

struct ChunkMatch {
  std::string block_id;
  // Empty when the chunk cannot be mapped back to a single editor block.
  std::optional<std::string> source_block_id;
  std::string source_type;
  std::string source_title;
  std::string content;
  std::string block_type;
  std::string heading_context;
  float score = 0.0f;
  std::string doc_id;
};

struct DocumentSearchResult {
  std::string doc_id;
  std::string doc_title;
  float max_score = 0.0f;
  std::vector<ChunkMatch> matched_chunks;
};

struct FolderIndexResult {
  int total_files = 0;
  int success_count = 0;
  int failed_count = 0;
  std::vector<std::string> failed_files;
};

struct IndexReport {
  int embedded = 0;
  int skipped = 0;
  int deleted = 0;
  int failed = 0;

  bool succeeded() const { return !(embedded == 0 && failed > 0); }
};

struct ReindexSummary {
  int succeeded = 0;
  int failed = 0;
  std::vector<std::string> failed_ids;
};

}  // namespace rag_core
