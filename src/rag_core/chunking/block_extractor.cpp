#include "rag_core/chunking/block_extractor.hpp"

#include "rag_core/chunking/block_parser.hpp"
#include "rag_core/chunking/text_chunker.hpp"
#include "rag_core/utils/hash.hpp"
#include "rag_core/utils/text_utils.hpp"

namespace rag_core {

namespace {

bool is_heading_type(const std::string& type) {
  return type.starts_with("heading");
}

std::string source_of(const ExtractedBlock& block) {
  return block.source_block_id.empty() ? block.id : block.source_block_id;
}

void flatten_children(const std::vector<Block>& children,
                      const std::string& heading,
                      int depth,
                      ExtractedBlocks& out) {
  const std::string indent(static_cast<size_t>(depth) * 2, ' ');
  for (const auto& child : children) {
    if (!child.text.empty()) {
      out.push_back({.id = child.id,
                     .source_block_id = "",
                     .type = child.type,
                     .content = indent + child.text,
                     .heading_context = heading});
    }
    flatten_children(child.children, heading, depth + 1, out);
  }
}

}  // namespace

ExtractedBlocks BlockExtractor::extract(std::string_view content) const {
  auto blocks = parse_blocks(content);
  if (!blocks) {
    return {};
  }
  return extract(*blocks);
}

ExtractedBlocks BlockExtractor::extract(const std::vector<Block>& blocks) const {
  return merge_short_blocks(merge_headings(aggregate_and_split(flatten(blocks))));
}

ExtractedBlocks BlockExtractor::flatten(const std::vector<Block>& blocks) {
  ExtractedBlocks out;
  std::string current_heading;
  for (const auto& block : blocks) {
    if (block.kind == BlockKind::Heading) {
      current_heading = block.text;
    }
    if (!block.text.empty()) {
      out.push_back({.id = block.id,
                     .source_block_id = "",
                     .type = block.type,
                     .content = block.text,
                     .heading_context = current_heading});
    }
    flatten_children(block.children, current_heading, 1, out);
  }
  return out;
}

ExtractedBlocks BlockExtractor::aggregate_and_split(const ExtractedBlocks& blocks) const {
  ExtractedBlocks out;
  size_t i = 0;
  while (i < blocks.size()) {
    const ExtractedBlock& block = blocks[i];

    if (block_kind_from_type(block.type) == BlockKind::ListItem) {
      std::vector<std::string> ids;
      std::vector<std::string> lines;
      size_t j = i;
      while (j < blocks.size() && blocks[j].type == block.type) {
        ids.push_back(blocks[j].id);
        lines.push_back("• " + blocks[j].content);
        ++j;
      }
      out.push_back({.id = aggregated_id(ids),
                     .source_block_id = block.id,
                     .type = "aggregated_" + block.type,
                     .content = text::join(lines, "\n"),
                     .heading_context = block.heading_context});
      i = j;
      continue;
    }

    if (config_.max_chunk_size > 0 &&
        text::char_length(block.content) > static_cast<size_t>(config_.max_chunk_size)) {
      for (auto& piece : split_long_block(block)) {
        out.push_back(std::move(piece));
      }
    } else {
      out.push_back(block);
    }
    ++i;
  }
  return out;
}

ExtractedBlocks BlockExtractor::split_long_block(const ExtractedBlock& block) const {
  std::vector<std::string> pieces = split_long_text(block.content, config_);
  if (pieces.size() <= 1) {
    return {block};
  }

  ExtractedBlocks out;
  out.reserve(pieces.size());
  for (size_t n = 0; n < pieces.size(); ++n) {
    out.push_back({.id = block.id + "_chunk_" + std::to_string(n),
                   .source_block_id = source_of(block),
                   .type = block.type + "_chunk",
                   .content = std::move(pieces[n]),
                   .heading_context = block.heading_context});
  }
  return out;
}

ExtractedBlocks BlockExtractor::merge_headings(const ExtractedBlocks& blocks) {
  ExtractedBlocks out;
  std::vector<const ExtractedBlock*> pending;

  auto pending_text = [&pending]() {
    std::vector<std::string> texts;
    for (const auto* heading : pending)
      texts.push_back(heading->content);
    return text::join(texts, "\n");
  };

  for (const auto& block : blocks) {
    if (is_heading_type(block.type)) {
      pending.push_back(&block);
      continue;
    }
    ExtractedBlock merged = block;
    if (!pending.empty()) {
      merged.content = pending_text() + "\n\n" + block.content;
      pending.clear();
    }
    out.push_back(std::move(merged));
  }

  if (!pending.empty()) {
    std::vector<std::string> ids;
    for (const auto* heading : pending)
      ids.push_back(heading->id);
    out.push_back({.id = aggregated_id(ids),
                   .source_block_id = pending.front()->id,
                   .type = "trailing_headings",
                   .content = pending_text(),
                   .heading_context = pending.back()->content});
  }
  return out;
}

bool BlockExtractor::can_merge(const ExtractedBlock& block) const {
  if (block.type.starts_with("aggregated_") || is_heading_type(block.type)) {
    return false;
  }
  return text::char_length(block.content) < static_cast<size_t>(config_.short_block_threshold);
}

ExtractedBlocks BlockExtractor::merge_short_blocks(const ExtractedBlocks& blocks) const {
  if (config_.short_block_threshold <= 0) {
    return blocks;
  }

  ExtractedBlocks out;
  size_t i = 0;
  while (i < blocks.size()) {
    const ExtractedBlock& start = blocks[i];
    if (!can_merge(start)) {
      out.push_back(start);
      ++i;
      continue;
    }

    std::vector<std::string> ids;
    std::vector<std::string> contents;
    size_t total = 0;
    size_t j = i;
    for (; j < blocks.size(); ++j) {
      const ExtractedBlock& candidate = blocks[j];
      if (!can_merge(candidate) || candidate.heading_context != start.heading_context) {
        break;
      }
      size_t new_len = total + text::char_length(candidate.content);
      if (total > 0)
        new_len += 1;
      if (total > 0 && new_len > static_cast<size_t>(config_.max_merged_length)) {
        break;
      }
      ids.push_back(candidate.id);
      contents.push_back(candidate.content);
      total = new_len;
    }

    if (contents.size() == 1) {
      out.push_back(start);
    } else {
      out.push_back({.id = aggregated_id(ids),
                     .source_block_id = source_of(start),
                     .type = "merged_short_blocks",
                     .content = text::join(contents, "\n"),
                     .heading_context = start.heading_context});
    }
    i = j;
  }
  return out;
}

}  // namespace rag_core
