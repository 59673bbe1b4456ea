#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "rag_core/db/vector_store.hpp"
#include "rag_core/llm/embedding_provider.hpp"
#include "rag_core/services/document_repository.hpp"
#include "rag_core/types/search.hpp"

namespace rag_core {

class SearchService {
 public:
  static constexpr int kMaxChunksPerDocument = 3;
  static constexpr size_t kRelatedQueryMaxChars = 500;

  SearchService(std::shared_ptr<VectorStore> store,
                std::shared_ptr<EmbeddingProvider> embedder,
                std::shared_ptr<DocumentRepository> repository);

  // Nearest chunks to the query, best first, score = 1 - cosine distance.
  std::vector<ChunkMatch> search_chunks(const std::string& query, int limit, const SearchFilter& filter = {});

  /**
   * @brief Ranks documents by their best matching chunk.
   *
   * Fetches max(limit * 5, 20) chunk hits so that documents whose best chunk sits
   * just below the top few still get a chance, then keeps the best
   * kMaxChunksPerDocument chunks of every document.
   */
  std::vector<DocumentSearchResult> search_documents(const std::string& query,
                                                     int limit,
                                                     const SearchFilter& filter = {});

  // Documents similar to doc_id, using its own text as the query. The document itself is excluded.
  std::vector<DocumentSearchResult> search_related(const std::string& doc_id, int limit);

  // Groups hits by document and orders both levels by score. Hits must belong to some document.
  static std::vector<DocumentSearchResult> aggregate_by_document(const std::vector<ChunkMatch>& matches,
                                                                 int limit);

 private:
  std::vector<ChunkMatch> nearest(const std::string& query, int k, const SearchFilter& filter);
  std::vector<DocumentSearchResult> with_titles(std::vector<DocumentSearchResult> results);

  std::shared_ptr<VectorStore> store_;
  std::shared_ptr<EmbeddingProvider> embedder_;
  std::shared_ptr<DocumentRepository> repository_;
};

/**
 * @brief Maps a stored chunk back to the editor block it came from.
 *
 * Rows written by current indexers always carry a source block. For older rows
 * the ID is parsed after dropping any "_chunk_N" split suffix: composite external
 * IDs yield their block UUID, plain IDs are used when they are UUIDs. Anything
 * else, aggregate IDs included, cannot be mapped and yields std::nullopt.
 */
std::optional<std::string> resolve_source_block_id(const VectorSearchHit& hit);

ChunkMatch to_chunk_match(const VectorSearchHit& hit);

}  // namespace rag_core
