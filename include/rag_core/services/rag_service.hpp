#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "rag_core/async/reindex_job.hpp"
#include "rag_core/config/embedding_config.hpp"
#include "rag_core/db/database_manager.hpp"
#include "rag_core/db/vector_store.hpp"
#include "rag_core/llm/embedding_provider.hpp"
#include "rag_core/services/content_sources.hpp"
#include "rag_core/services/document_indexer.hpp"
#include "rag_core/services/document_repository.hpp"
#include "rag_core/services/external_indexer.hpp"
#include "rag_core/services/graph_service.hpp"
#include "rag_core/services/search_service.hpp"

namespace rag_core {

class RagServiceError : public std::exception {
 public:
  explicit RagServiceError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override { return message_.c_str(); }

 private:
  std::string message_;
};

struct RagServiceOptions {
  std::filesystem::path data_dir = "./data";
  std::string db_file_name = "rag.db";
  int pool_size = 4;
  ChunkConfig chunk_config;
};

using ProviderFactory = std::function<std::shared_ptr<EmbeddingProvider>(const EmbeddingConfig&)>;

/**
 * @class RagService
 * @brief Entry point of the engine: wires configuration, provider, store, indexers and searchers.
 *
 * Every operation runs under a shared lock. reinitialize() builds the new provider
 * first, then swaps all components under the exclusive lock, so an operation runs
 * entirely against either the old or the new set.
 */
class RagService {
 public:
  RagService(RagServiceOptions options,
             std::shared_ptr<DocumentRepository> repository,
             ProviderFactory provider_factory,
             std::shared_ptr<TextExtractor> extractor,
             std::shared_ptr<WebContentFetcher> fetcher);
  ~RagService();

  RagService(const RagService&) = delete;
  RagService& operator=(const RagService&) = delete;

  /**
   * @brief Opens the database, loads the embedding config and builds the components.
   *
   * @throws EmbeddingServiceError when the provider cannot be reached to detect its dimension.
   * @throws VectorStoreError on database failures.
   */
  void initialize();

  /**
   * @brief Reloads the embedding config and rebuilds every component.
   *
   * When the embedding dimension changed the stored chunks are gone, so a full
   * background reindex is started.
   *
   * @return true when that background reindex was started.
   */
  bool reinitialize();

  bool is_initialized() const;
  EmbeddingConfig embedding_config() const;
  // Saves the config to the data directory and reinitializes.
  bool update_embedding_config(const EmbeddingConfig& config);
  // Stops background work and closes the database.
  void shutdown();

  IndexReport index_document(const std::string& doc_id);
  IndexReport force_reindex_document(const std::string& doc_id);
  int delete_document(const std::string& doc_id);
  ReindexSummary reindex_all(const ProgressCallback& on_progress = {}, const CancelCheck& is_cancelled = {});
  int reindex_external(const ProgressCallback& on_progress = {}, const CancelCheck& is_cancelled = {});

  int index_bookmark(const std::string& url, const std::string& doc_id, const std::string& block_id);
  int index_file(const std::string& file_path,
                 const std::string& doc_id,
                 const std::string& block_id,
                 const std::string& file_name = "");
  FolderIndexResult index_folder(const std::string& folder_path,
                                 const std::string& doc_id,
                                 const std::string& block_id,
                                 int max_depth = 0);

  std::vector<DocumentSearchResult> search_documents(const std::string& query,
                                                     int limit,
                                                     const SearchFilter& filter = {});
  std::vector<ChunkMatch> search_chunks(const std::string& query, int limit, const SearchFilter& filter = {});
  std::vector<DocumentSearchResult> search_related(const std::string& doc_id, int limit);

  GraphData build_graph(float threshold = GraphService::kDefaultThreshold);
  IndexStats get_indexed_stats();
  std::optional<ExternalBlockContent> get_external_content(const std::string& doc_id, const std::string& block_id);

  // Full reindex on a background thread. Returns false if one is already running.
  bool start_background_reindex();
  async::ReindexProgress reindex_progress() const;
  void wait_for_background_reindex();

 private:
  struct Components {
    EmbeddingConfig config;
    std::shared_ptr<EmbeddingProvider> provider;
    std::shared_ptr<VectorStore> store;
    std::shared_ptr<DocumentIndexer> indexer;
    std::shared_ptr<ExternalIndexer> external_indexer;
    std::shared_ptr<SearchService> searcher;
    std::shared_ptr<GraphService> graph;
  };

  // Caller holds mutex_ (shared or exclusive).
  const Components& components() const;
  std::unique_ptr<Components> build_components(const EmbeddingConfig& config,
                                               std::shared_ptr<EmbeddingProvider> provider,
                                               bool& cleared);
  void ensure_database();

  RagServiceOptions options_;
  std::shared_ptr<DocumentRepository> repository_;
  ProviderFactory provider_factory_;
  std::shared_ptr<TextExtractor> extractor_;
  std::shared_ptr<WebContentFetcher> fetcher_;

  DatabaseManager db_manager_;
  mutable std::shared_mutex mutex_;
  std::unique_ptr<Components> components_;
  async::ReindexJob reindex_job_;
};

}  // namespace rag_core
