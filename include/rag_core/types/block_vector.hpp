#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace rag_core {

// Block types written by the external content pipeline.
inline constexpr const char* kBookmarkType = "bookmark";
inline constexpr const char* kFileType = "file";
inline constexpr const char* kFolderType = "folder";

inline bool is_external_type(const std::string& block_type) {
  return block_type == kBookmarkType || block_type == kFileType || block_type == kFolderType;
}

// A stored chunk row together with its embedding.
struct BlockVector {
  std::string id;
  std::string source_block_id;
  std::string doc_id;
  std::string content;
  std::string content_hash;
  std::string block_type;
  std::string heading_context;
  std::string file_path;
  std::vector<float> embedding;
};

// At most one of the fields is expected to be set by callers, but all are honoured.
struct SearchFilter {
  std::string doc_id;
  std::string source_block_id;
  std::string exclude_doc_id;

  bool empty() const {
    return doc_id.empty() && source_block_id.empty() && exclude_doc_id.empty();
  }
};

struct VectorSearchHit {
  std::string id;
  std::string doc_id;
  std::string content;
  std::string block_type;
  std::string heading_context;
  std::string source_block_id;
  float distance = 0.0f;
};

// Raw pre-chunking content of a bookmark, file or folder block.
struct ExternalBlockContent {
  std::string id;
  std::string doc_id;
  std::string block_id;
  std::string block_type;
  std::string url;
  std::string file_path;
  std::string title;
  std::string raw_content;
  int64_t extracted_at = 0;
};

struct IndexStats {
  int documents = 0;
  int bookmarks = 0;
  int files = 0;
  int folders = 0;
};

// All chunk vectors of one graph entity.
struct EntityVectors {
  std::string entity_id;
  std::string doc_id;
  std::string source_block_id;
  std::string block_type;  // empty for in-document chunks
  std::string title;
  std::vector<std::vector<float>> vectors;
};

}  // namespace rag_core
