#pragma once

#include <string>
#include <vector>

namespace rag_core {

// Thresholds are measured in Unicode code points.
struct ChunkConfig {
  int max_chunk_size = 800;
  int overlap = 100;
  int short_block_threshold = 150;
  int max_merged_length = 600;
};

// A unit of text ready to be embedded.
struct ExtractedBlock {
  std::string id;
  // Original user-authored block this chunk traces back to. Empty means "same as id".
  std::string source_block_id;
  std::string type;
  std::string content;
  std::string heading_context;

  bool operator==(const ExtractedBlock& other) const = default;
};

using ExtractedBlocks = std::vector<ExtractedBlock>;

}  // namespace rag_core
