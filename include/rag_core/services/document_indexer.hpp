#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "rag_core/chunking/block_extractor.hpp"
#include "rag_core/db/vector_store.hpp"
#include "rag_core/llm/embedding_provider.hpp"
#include "rag_core/services/document_repository.hpp"
#include "rag_core/types/search.hpp"

namespace rag_core {

// (current, total) after each unit of work.
using ProgressCallback = std::function<void(int current, int total)>;
// Polled between units; returning true stops a bulk run early.
using CancelCheck = std::function<bool()>;

/**
 * @class DocumentIndexer
 * @brief Keeps the stored chunks of in-app documents in sync with their content.
 *
 * Incremental indexing compares hash_content(content + heading_context) of every
 * extracted chunk against the stored hash and embeds only what changed. Chunks of
 * bookmark, file and folder blocks are owned by ExternalIndexer and are only
 * removed here when their block disappears from the document.
 */
class DocumentIndexer {
 public:
  DocumentIndexer(std::shared_ptr<VectorStore> store,
                  std::shared_ptr<EmbeddingProvider> embedder,
                  std::shared_ptr<DocumentRepository> repository,
                  ChunkConfig config = {});

  /**
   * @brief Re-embeds changed chunks, deletes stale ones and cleans up removed external blocks.
   * @throws EmbeddingServiceError (the last one seen) when every changed chunk failed to embed.
   */
  IndexReport index_document(const std::string& doc_id);

  // Discards the document's non-external chunks and embeds everything again.
  IndexReport force_reindex_document(const std::string& doc_id);

  /**
   * @brief Force-reindexes every document in the repository.
   *
   * Rows of documents no longer in the repository are purged first. A failing
   * document is logged and counted; the run continues with the next one.
   */
  ReindexSummary reindex_all(const ProgressCallback& on_progress = {},
                             const CancelCheck& is_cancelled = {});

  int delete_document(const std::string& doc_id);

  void set_chunk_config(const ChunkConfig& config);
  ChunkConfig chunk_config() const;

 private:
  IndexReport embed_and_store(const std::string& doc_id,
                              const ExtractedBlocks& chunks,
                              const std::map<std::string, std::string>& existing_hashes);
  void cleanup_orphan_external(const std::string& doc_id, const ExternalRefs& refs);
  void debug_dump(const std::string& title, const std::string& doc_id, const ExtractedBlocks& chunks) const;
  BlockExtractor extractor() const;

  std::shared_ptr<VectorStore> store_;
  std::shared_ptr<EmbeddingProvider> embedder_;
  std::shared_ptr<DocumentRepository> repository_;
  mutable std::mutex config_mutex_;
  ChunkConfig config_;
  bool debug_chunks_;
};

// True for chunk IDs written by the external content pipeline.
bool is_external_chunk_id(const std::string& id);

}  // namespace rag_core
