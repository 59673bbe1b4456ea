#include "rag_core/services/rag_service.hpp"

#include <iostream>
#include <mutex>

namespace rag_core {

RagService::RagService(RagServiceOptions options,
                       std::shared_ptr<DocumentRepository> repository,
                       ProviderFactory provider_factory,
                       std::shared_ptr<TextExtractor> extractor,
                       std::shared_ptr<WebContentFetcher> fetcher)
    : options_(std::move(options)),
      repository_(std::move(repository)),
      provider_factory_(std::move(provider_factory)),
      extractor_(std::move(extractor)),
      fetcher_(std::move(fetcher)),
      reindex_job_(
          [this](const ProgressCallback& on_progress, const CancelCheck& is_cancelled) {
            return reindex_all(on_progress, is_cancelled);
          },
          [this](const ProgressCallback& on_progress, const CancelCheck& is_cancelled) {
            return reindex_external(on_progress, is_cancelled);
          }) {}

RagService::~RagService() {
  shutdown();
}

void RagService::ensure_database() {
  if (!db_manager_.is_initialized()) {
    db_manager_.initialize(options_.data_dir / options_.db_file_name, options_.pool_size);
  }
}

std::unique_ptr<RagService::Components> RagService::build_components(const EmbeddingConfig& config,
                                                                      std::shared_ptr<EmbeddingProvider> provider,
                                                                      bool& cleared) {
  auto parts = std::make_unique<Components>();
  parts->config = config;
  parts->provider = std::move(provider);
  parts->store = std::make_shared<VectorStore>(db_manager_);
  cleared = parts->store->open(parts->provider->dimension());
  parts->indexer =
      std::make_shared<DocumentIndexer>(parts->store, parts->provider, repository_, options_.chunk_config);
  parts->external_indexer = std::make_shared<ExternalIndexer>(parts->store, parts->provider, repository_,
                                                              extractor_, fetcher_, options_.data_dir,
                                                              options_.chunk_config);
  parts->searcher = std::make_shared<SearchService>(parts->store, parts->provider, repository_);
  parts->graph = std::make_shared<GraphService>(parts->store, repository_);
  return parts;
}

void RagService::initialize() {
  reinitialize();
}

bool RagService::reinitialize() {
  const EmbeddingConfig config = EmbeddingConfig::load(options_.data_dir);
  std::shared_ptr<EmbeddingProvider> provider = provider_factory_(config);
  if (!provider) {
    throw RagServiceError("no embedding provider for " + config.provider);
  }
  const int dimension = provider->detect_dimension();
  std::cout << "[RagService] Embedding provider " << provider->name() << " (" << config.model
            << "), dimension " << dimension << std::endl;

  // A running reindex would otherwise keep the shared lock for its whole duration.
  reindex_job_.stop();

  bool cleared = false;
  {
    std::unique_lock lock(mutex_);
    ensure_database();
    components_.reset();
    components_ = build_components(config, std::move(provider), cleared);
  }

  if (cleared) {
    std::cout << "[RagService] Embedding dimension changed, starting full reindex" << std::endl;
    return reindex_job_.start();
  }
  return false;
}

bool RagService::is_initialized() const {
  std::shared_lock lock(mutex_);
  return components_ != nullptr;
}

EmbeddingConfig RagService::embedding_config() const {
  std::shared_lock lock(mutex_);
  if (components_) {
    return components_->config;
  }
  return EmbeddingConfig::load(options_.data_dir);
}

bool RagService::update_embedding_config(const EmbeddingConfig& config) {
  config.save(options_.data_dir);
  return reinitialize();
}

void RagService::shutdown() {
  reindex_job_.stop();
  std::unique_lock lock(mutex_);
  components_.reset();
  db_manager_.shutdown();
}

const RagService::Components& RagService::components() const {
  if (!components_) {
    throw RagServiceError("RAG service is not initialized");
  }
  return *components_;
}

IndexReport RagService::index_document(const std::string& doc_id) {
  std::shared_lock lock(mutex_);
  return components().indexer->index_document(doc_id);
}

IndexReport RagService::force_reindex_document(const std::string& doc_id) {
  std::shared_lock lock(mutex_);
  return components().indexer->force_reindex_document(doc_id);
}

int RagService::delete_document(const std::string& doc_id) {
  std::shared_lock lock(mutex_);
  return components().indexer->delete_document(doc_id);
}

ReindexSummary RagService::reindex_all(const ProgressCallback& on_progress, const CancelCheck& is_cancelled) {
  std::shared_lock lock(mutex_);
  return components().indexer->reindex_all(on_progress, is_cancelled);
}

int RagService::reindex_external(const ProgressCallback& on_progress, const CancelCheck& is_cancelled) {
  std::shared_lock lock(mutex_);
  return components().external_indexer->reindex_all(on_progress, is_cancelled);
}

int RagService::index_bookmark(const std::string& url, const std::string& doc_id, const std::string& block_id) {
  std::shared_lock lock(mutex_);
  return components().external_indexer->index_bookmark(url, doc_id, block_id);
}

int RagService::index_file(const std::string& file_path,
                           const std::string& doc_id,
                           const std::string& block_id,
                           const std::string& file_name) {
  std::shared_lock lock(mutex_);
  return components().external_indexer->index_file(file_path, doc_id, block_id, file_name);
}

FolderIndexResult RagService::index_folder(const std::string& folder_path,
                                           const std::string& doc_id,
                                           const std::string& block_id,
                                           int max_depth) {
  std::shared_lock lock(mutex_);
  return components().external_indexer->index_folder(folder_path, doc_id, block_id, max_depth);
}

std::vector<DocumentSearchResult> RagService::search_documents(const std::string& query,
                                                               int limit,
                                                               const SearchFilter& filter) {
  std::shared_lock lock(mutex_);
  return components().searcher->search_documents(query, limit, filter);
}

std::vector<ChunkMatch> RagService::search_chunks(const std::string& query,
                                                  int limit,
                                                  const SearchFilter& filter) {
  std::shared_lock lock(mutex_);
  return components().searcher->search_chunks(query, limit, filter);
}

std::vector<DocumentSearchResult> RagService::search_related(const std::string& doc_id, int limit) {
  std::shared_lock lock(mutex_);
  return components().searcher->search_related(doc_id, limit);
}

GraphData RagService::build_graph(float threshold) {
  std::shared_lock lock(mutex_);
  return components().graph->build_graph(threshold);
}

IndexStats RagService::get_indexed_stats() {
  std::shared_lock lock(mutex_);
  return components().store->get_indexed_stats();
}

std::optional<ExternalBlockContent> RagService::get_external_content(const std::string& doc_id,
                                                                     const std::string& block_id) {
  std::shared_lock lock(mutex_);
  return components().store->get_external_content(doc_id, block_id);
}

bool RagService::start_background_reindex() {
  if (!is_initialized()) {
    throw RagServiceError("RAG service is not initialized");
  }
  return reindex_job_.start();
}

async::ReindexProgress RagService::reindex_progress() const {
  return reindex_job_.progress();
}

void RagService::wait_for_background_reindex() {
  reindex_job_.wait();
}

}  // namespace rag_core
