#include "rag_core/chunking/block_parser.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>

#include "rag_core/utils/text_utils.hpp"

namespace rag_core {

namespace {

using nlohmann::json;

std::string string_field(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) {
    return "";
  }
  return it->get<std::string>();
}

std::string inline_text(const json& items) {
  std::string out;
  for (const auto& item : items) {
    if (!item.is_object())
      continue;
    const std::string type = string_field(item, "type");
    if (type == "text") {
      out += string_field(item, "text");
    } else if (type == "link") {
      auto link_content = item.find("content");
      if (link_content != item.end() && link_content->is_array()) {
        out += inline_text(*link_content);
      }
    }
  }
  return out;
}

Block block_from_json(const json& j) {
  Block block;
  block.id = string_field(j, "id");
  block.type = string_field(j, "type");
  block.kind = block_kind_from_type(block.type);

  auto content = j.find("content");
  if (content != j.end() && content->is_array()) {
    block.text = text::trim(text::sanitize_utf8(inline_text(*content)));
  }

  auto props = j.find("props");
  if (props != j.end() && props->is_object()) {
    for (auto it = props->begin(); it != props->end(); ++it) {
      if (it->is_string()) {
        block.props[it.key()] = it->get<std::string>();
      } else if (it->is_number() || it->is_boolean()) {
        block.props[it.key()] = it->dump();
      }
    }
  }

  auto children = j.find("children");
  if (children != j.end() && children->is_array()) {
    for (const auto& child : *children) {
      if (child.is_object()) {
        block.children.push_back(block_from_json(child));
      }
    }
  }
  return block;
}

void collect_refs(const std::vector<Block>& blocks, ExternalRefs& refs) {
  for (const auto& block : blocks) {
    switch (block.kind) {
      case BlockKind::Bookmark:
        refs.bookmarks.push_back({block.id, block.prop("url")});
        break;
      case BlockKind::File: {
        std::string name = block.prop("fileName");
        refs.files.push_back({block.id, block.prop("filePath"), name});
        break;
      }
      case BlockKind::Folder: {
        std::string path = block.prop("folderPath");
        std::string name = block.prop("folderName");
        if (name.empty() && !path.empty()) {
          name = std::filesystem::path(path).filename().string();
        }
        refs.folders.push_back({block.id, path, name});
        break;
      }
      default:
        break;
    }
    collect_refs(block.children, refs);
  }
}

void collect_text(const std::vector<Block>& blocks, std::vector<std::string>& texts) {
  for (const auto& block : blocks) {
    if (!block.text.empty()) {
      texts.push_back(block.text);
    }
    collect_text(block.children, texts);
  }
}

}  // namespace

std::vector<std::string> ExternalRefs::bookmark_block_ids() const {
  std::vector<std::string> ids;
  for (const auto& b : bookmarks)
    ids.push_back(b.block_id);
  return ids;
}

std::vector<std::string> ExternalRefs::file_block_ids() const {
  std::vector<std::string> ids;
  for (const auto& f : files)
    ids.push_back(f.block_id);
  return ids;
}

std::vector<std::string> ExternalRefs::folder_block_ids() const {
  std::vector<std::string> ids;
  for (const auto& f : folders)
    ids.push_back(f.block_id);
  return ids;
}

std::optional<std::vector<Block>> parse_blocks(std::string_view content) {
  json root = json::parse(content.begin(), content.end(), nullptr, /*allow_exceptions*/ false);
  if (root.is_discarded() || !root.is_array()) {
    return std::nullopt;
  }

  std::vector<Block> blocks;
  blocks.reserve(root.size());
  for (const auto& item : root) {
    if (item.is_object()) {
      blocks.push_back(block_from_json(item));
    }
  }
  return blocks;
}

ExternalRefs extract_external_refs(const std::vector<Block>& blocks) {
  ExternalRefs refs;
  collect_refs(blocks, refs);
  return refs;
}

ExternalRefs extract_external_refs(std::string_view content) {
  auto blocks = parse_blocks(content);
  if (!blocks) {
    return {};
  }
  return extract_external_refs(*blocks);
}

std::string extract_plain_text(std::string_view content, size_t max_chars) {
  auto blocks = parse_blocks(content);
  if (!blocks) {
    return "";
  }
  std::vector<std::string> texts;
  collect_text(*blocks, texts);

  std::string result = text::join(texts, " ");
  if (max_chars > 0 && text::char_length(result) > max_chars) {
    result = text::head_chars(result, max_chars);
  }
  return text::trim(result);
}

}  // namespace rag_core
