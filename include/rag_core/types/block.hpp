#pragma once

#include <map>
#include <string>
#include <vector>

namespace rag_core {

enum class BlockKind { Heading, ListItem, Bookmark, File, Folder, Other };

inline BlockKind block_kind_from_type(const std::string& type) {
  if (type.rfind("heading", 0) == 0)
    return BlockKind::Heading;
  if (type == "bulletListItem" || type == "numberedListItem" || type == "checkListItem")
    return BlockKind::ListItem;
  if (type == "bookmark")
    return BlockKind::Bookmark;
  if (type == "file")
    return BlockKind::File;
  if (type == "folder")
    return BlockKind::Folder;
  return BlockKind::Other;
}

// One node of the editor's block tree, decoded with defaults for missing fields.
struct Block {
  std::string id;
  std::string type;
  BlockKind kind = BlockKind::Other;
  std::string text;
  std::map<std::string, std::string> props;
  std::vector<Block> children;

  std::string prop(const std::string& key) const {
    auto it = props.find(key);
    return it == props.end() ? std::string() : it->second;
  }
};

struct BookmarkRef {
  std::string block_id;
  std::string url;
};

struct FileRef {
  std::string block_id;
  std::string file_path;
  std::string file_name;
};

struct FolderRef {
  std::string block_id;
  std::string folder_path;
  std::string folder_name;
};

// External blocks currently present in a document.
struct ExternalRefs {
  std::vector<BookmarkRef> bookmarks;
  std::vector<FileRef> files;
  std::vector<FolderRef> folders;

  std::vector<std::string> bookmark_block_ids() const;
  std::vector<std::string> file_block_ids() const;
  std::vector<std::string> folder_block_ids() const;
};

}  // namespace rag_core
