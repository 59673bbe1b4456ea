#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "rag_core/db/vector_store.hpp"
#include "rag_core/services/document_repository.hpp"
#include "rag_core/types/graph.hpp"

namespace rag_core {

/**
 * @class GraphService
 * @brief Similarity graph over every indexed document and external block.
 *
 * Each entity is represented by the mean of its chunk embeddings. Pairs are
 * compared exhaustively, which is fine for a personal note collection but not
 * for much more than a few thousand entities.
 */
class GraphService {
 public:
  static constexpr float kDefaultThreshold = 0.5f;

  GraphService(std::shared_ptr<VectorStore> store, std::shared_ptr<DocumentRepository> repository);

  GraphData build_graph(float threshold = kDefaultThreshold);

  /**
   * @brief Scores one pair of entities.
   *
   * Shared tags raise the cosine similarity by jaccard * 0.5 * (1 - threshold),
   * clamped to 1. The link is returned only when the raw similarity reaches the
   * threshold or the tag-boosted one does.
   */
  static std::optional<GraphLink> score_pair(const std::string& source,
                                             const std::string& target,
                                             float similarity,
                                             const std::vector<std::string>& source_tags,
                                             const std::vector<std::string>& target_tags,
                                             float threshold);

  static float jaccard(const std::vector<std::string>& a, const std::vector<std::string>& b);

 private:
  std::shared_ptr<VectorStore> store_;
  std::shared_ptr<DocumentRepository> repository_;
};

std::vector<float> mean_vector(const std::vector<std::vector<float>>& vectors);
float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

}  // namespace rag_core
