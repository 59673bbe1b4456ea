#include "rag_core/services/graph_service.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <map>
#include <set>

namespace rag_core {

std::vector<float> mean_vector(const std::vector<std::vector<float>>& vectors) {
  if (vectors.empty()) {
    return {};
  }
  std::vector<float> mean(vectors.front().size(), 0.0f);
  for (const auto& v : vectors) {
    for (size_t i = 0; i < mean.size() && i < v.size(); ++i) {
      mean[i] += v[i];
    }
  }
  const float n = static_cast<float>(vectors.size());
  for (auto& x : mean) {
    x /= n;
  }
  return mean;
}

float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
  if (a.empty() || a.size() != b.size()) {
    return 0.0f;
  }
  double dot = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;
  for (size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * b[i];
    norm_a += static_cast<double>(a[i]) * a[i];
    norm_b += static_cast<double>(b[i]) * b[i];
  }
  if (norm_a == 0.0 || norm_b == 0.0) {
    return 0.0f;
  }
  return static_cast<float>(dot / (std::sqrt(norm_a) * std::sqrt(norm_b)));
}

GraphService::GraphService(std::shared_ptr<VectorStore> store, std::shared_ptr<DocumentRepository> repository)
    : store_(std::move(store)), repository_(std::move(repository)) {}

float GraphService::jaccard(const std::vector<std::string>& a, const std::vector<std::string>& b) {
  const std::set<std::string> set_a(a.begin(), a.end());
  const std::set<std::string> set_b(b.begin(), b.end());
  if (set_a.empty() || set_b.empty()) {
    return 0.0f;
  }
  size_t shared = 0;
  for (const auto& tag : set_a) {
    shared += set_b.count(tag);
  }
  const size_t combined = set_a.size() + set_b.size() - shared;
  return static_cast<float>(shared) / static_cast<float>(combined);
}

std::optional<GraphLink> GraphService::score_pair(const std::string& source,
                                                  const std::string& target,
                                                  float similarity,
                                                  const std::vector<std::string>& source_tags,
                                                  const std::vector<std::string>& target_tags,
                                                  float threshold) {
  const float overlap = jaccard(source_tags, target_tags);
  const float weight = 0.5f * (1.0f - threshold);
  const float boosted = std::min(1.0f, similarity * (1.0f + overlap * weight));

  GraphLink link;
  link.source = source;
  link.target = target;
  link.similarity = boosted;
  link.has_semantic = similarity >= threshold;
  link.has_tags = overlap > 0.0f && boosted >= threshold;
  if (!link.has_semantic && !link.has_tags) {
    return std::nullopt;
  }
  return link;
}

GraphData GraphService::build_graph(float threshold) {
  std::map<std::string, DocumentMeta> documents;
  for (auto& doc : repository_->get_all()) {
    documents[doc.id] = std::move(doc);
  }

  const auto entities = store_->get_entity_vectors();

  GraphData graph;
  std::vector<std::vector<float>> means;
  std::vector<std::vector<std::string>> tags;
  graph.nodes.reserve(entities.size());

  for (const auto& entity : entities) {
    if (entity.vectors.empty()) {
      continue;
    }
    GraphNode node;
    node.id = entity.entity_id;
    node.val = static_cast<int>(entity.vectors.size());
    std::vector<std::string> node_tags;
    if (entity.block_type.empty()) {
      node.type = "document";
      auto it = documents.find(entity.doc_id);
      if (it != documents.end()) {
        node.title = it->second.title;
        node.tags = it->second.tags;
        node_tags = it->second.tags;
      }
    } else {
      node.type = entity.block_type;
      node.title = entity.title;
      node.parent_doc_id = entity.doc_id;
      node.parent_block_id = entity.source_block_id;
    }
    graph.nodes.push_back(std::move(node));
    means.push_back(mean_vector(entity.vectors));
    tags.push_back(std::move(node_tags));
  }

  for (size_t i = 0; i < graph.nodes.size(); ++i) {
    for (size_t j = i + 1; j < graph.nodes.size(); ++j) {
      const float similarity = cosine_similarity(means[i], means[j]);
      auto link = score_pair(graph.nodes[i].id, graph.nodes[j].id, similarity, tags[i], tags[j], threshold);
      if (link) {
        graph.links.push_back(std::move(*link));
      }
    }
  }

  std::cout << "[Graph] Built graph with " << graph.nodes.size() << " nodes and " << graph.links.size()
            << " links (threshold " << threshold << ")" << std::endl;
  return graph;
}

}  // namespace rag_core
