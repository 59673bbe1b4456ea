#pragma once

#include <string>
#include <vector>

namespace rag_core {

struct GraphNode {
  std::string id;
  std::string type;  // document, bookmark, file or folder
  std::string title;
  std::vector<std::string> tags;
  int val = 0;  // number of chunks backing the node
  std::string parent_doc_id;
  std::string parent_block_id;
};

struct GraphLink {
  std::string source;
  std::string target;
  float similarity = 0.0f;
  bool has_semantic = false;
  bool has_tags = false;
};

struct GraphData {
  std::vector<GraphNode> nodes;
  std::vector<GraphLink> links;
};

}  // namespace rag_core
