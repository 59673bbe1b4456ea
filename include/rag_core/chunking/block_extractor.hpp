#pragma once

#include <string_view>
#include <vector>

#include "rag_core/types/block.hpp"
#include "rag_core/types/chunk.hpp"

namespace rag_core {

/**
 * @class BlockExtractor
 * @brief Turns an editor block tree into an ordered list of embeddable chunks.
 *
 * Extraction runs four passes, each producing a new sequence from the previous one:
 *   1. flatten: depth-first walk with heading tracking and indentation of nested blocks
 *   2. aggregate_and_split: same-type list runs become one chunk, long blocks are split
 *   3. merge_headings: headings are prefixed onto the following chunk
 *   4. merge_short_blocks: short neighbours under the same heading are joined
 *
 * The output depends only on the input blocks and the ChunkConfig.
 */
class BlockExtractor {
 public:
  explicit BlockExtractor(ChunkConfig config = {}) : config_(config) {}

  // Malformed content yields no chunks.
  ExtractedBlocks extract(std::string_view content) const;
  ExtractedBlocks extract(const std::vector<Block>& blocks) const;

  const ChunkConfig& config() const { return config_; }

  static ExtractedBlocks flatten(const std::vector<Block>& blocks);
  ExtractedBlocks aggregate_and_split(const ExtractedBlocks& blocks) const;
  static ExtractedBlocks merge_headings(const ExtractedBlocks& blocks);
  ExtractedBlocks merge_short_blocks(const ExtractedBlocks& blocks) const;

 private:
  ExtractedBlocks split_long_block(const ExtractedBlock& block) const;
  bool can_merge(const ExtractedBlock& block) const;

  ChunkConfig config_;
};

}  // namespace rag_core
