#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <exception>
#include <set>
#include <string>
#include <vector>

#include "rag_core/db/vector_store.hpp"
#include "rag_core/llm/embedding_provider.hpp"
#include "rag_core/services/content_sources.hpp"
#include "rag_core/services/document_indexer.hpp"
#include "rag_core/services/document_repository.hpp"
#include "rag_core/types/chunk.hpp"
#include "rag_core/types/search.hpp"

namespace rag_core {

/**
 * @class ExternalIndexer
 * @brief Indexes the content behind bookmark, file and folder blocks.
 *
 * Chunk IDs are "{doc}_{block}_{kind}_chunk_{n}" (folders add a per-file index
 * after the kind), so re-indexing a block is a prefix delete followed by inserts.
 * Every chunk carries the editor block ID as its source block. The raw text is
 * also kept as a compressed snapshot keyed by "{doc}_{block}".
 */
class ExternalIndexer {
 public:
  static constexpr int kDefaultFolderDepth = 10;

  ExternalIndexer(std::shared_ptr<VectorStore> store,
                  std::shared_ptr<EmbeddingProvider> embedder,
                  std::shared_ptr<DocumentRepository> repository,
                  std::shared_ptr<TextExtractor> extractor,
                  std::shared_ptr<WebContentFetcher> fetcher,
                  std::filesystem::path data_dir,
                  ChunkConfig config = {});

  // Each returns the number of chunks stored. Throws when nothing could be stored.
  int index_bookmark(const std::string& url, const std::string& doc_id, const std::string& block_id);
  int index_file(const std::string& file_path,
                 const std::string& doc_id,
                 const std::string& block_id,
                 const std::string& file_name = "");

  /**
   * @brief Indexes every supported file below folder_path.
   *
   * Hidden directories and node_modules, vendor and __pycache__ are skipped.
   * Files that cannot be read or embedded are listed in the result.
   *
   * @param max_depth Directory levels below the root to visit; <= 0 means kDefaultFolderDepth.
   * @throws ContentSourceError when the folder itself cannot be read.
   */
  FolderIndexResult index_folder(const std::string& folder_path,
                                 const std::string& doc_id,
                                 const std::string& block_id,
                                 int max_depth = 0);

  // Re-indexes every external block of every document. Returns the number indexed.
  int reindex_all(const ProgressCallback& on_progress = {}, const CancelCheck& is_cancelled = {});

  // Relative paths and app-relative "/files/..." paths live under the data directory.
  std::filesystem::path resolve_path(const std::string& path) const;

  static bool is_supported_extension(const std::filesystem::path& path);

  void set_chunk_config(const ChunkConfig& config);

 private:
  struct StoreOutcome {
    int stored = 0;
    int failed = 0;
    std::exception_ptr last_error;
  };

  StoreOutcome store_chunks(const ExtractedBlocks& chunks,
                            const std::string& doc_id,
                            const std::string& block_id,
                            const std::string& block_type,
                            const std::string& file_path);
  ExtractedBlocks chunk(const std::string& text,
                        const std::string& heading_context,
                        const std::string& base_id,
                        const std::string& block_type) const;
  void walk_folder(const std::filesystem::path& dir,
                   int depth,
                   int max_depth,
                   std::vector<std::filesystem::path>& files) const;
  void debug_dump(const std::string& title, const ExtractedBlocks& chunks) const;

  std::shared_ptr<VectorStore> store_;
  std::shared_ptr<EmbeddingProvider> embedder_;
  std::shared_ptr<DocumentRepository> repository_;
  std::shared_ptr<TextExtractor> extractor_;
  std::shared_ptr<WebContentFetcher> fetcher_;
  std::filesystem::path data_dir_;
  mutable std::mutex config_mutex_;
  ChunkConfig config_;
  bool debug_chunks_;
};

}  // namespace rag_core
