#pragma once

#include <faiss/IndexFlat.h>
#include <faiss/IndexIDMap.h>

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "rag_core/db/database_manager.hpp"
#include "rag_core/types/block_vector.hpp"

namespace rag_core {

class VectorStoreError : public std::exception {
 public:
  explicit VectorStoreError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override { return message_.c_str(); }

 private:
  std::string message_;
};

/**
 * @class VectorStore
 * @brief Chunk metadata and embeddings in SQLite, with an in-memory faiss index for k-NN.
 *
 * The vec_blocks table is authoritative; its integer label doubles as the faiss id.
 * The faiss index stores L2-normalised vectors in an inner-product index, so a
 * search score is the cosine similarity and distance = 1 - score.
 *
 * Writes take an exclusive lock across the SQLite transaction and the matching
 * faiss update; searches take a shared lock.
 */
class VectorStore {
 public:
  explicit VectorStore(DatabaseManager& db_manager);
  ~VectorStore();

  VectorStore(const VectorStore&) = delete;
  VectorStore& operator=(const VectorStore&) = delete;

  /**
   * @brief Binds the store to an embedding dimension and loads the faiss index.
   *
   * If a different dimension was committed before, every chunk row and vector is
   * deleted first. External content snapshots survive since they do not depend on
   * the embedding model.
   *
   * @return true when stored data was cleared because of a dimension change.
   */
  bool open(int dimension);

  int dimension() const;
  size_t size() const;

  // Replaces the metadata row and the vector of block.id in one transaction.
  void upsert(const BlockVector& block);

  // id -> content_hash for every row of the document.
  std::map<std::string, std::string> get_block_hashes(const std::string& doc_id);

  int delete_blocks(const std::vector<std::string>& ids);
  int delete_by_prefix(const std::string& prefix);
  int delete_by_doc_id(const std::string& doc_id);
  // Leaves bookmark, file and folder rows alone.
  int delete_non_external_by_doc_id(const std::string& doc_id);

  /**
   * @brief Removes rows of one external kind whose source block is no longer in the document.
   * @return The distinct non-empty file paths of the removed rows.
   */
  std::vector<std::string> delete_orphan_external(const std::string& doc_id,
                                                  const std::string& block_type,
                                                  const std::vector<std::string>& keep_block_ids);

  std::vector<std::string> get_all_doc_ids();
  std::vector<BlockVector> get_document_vectors(const std::string& doc_id);
  std::vector<EntityVectors> get_entity_vectors();

  std::vector<VectorSearchHit> search(const std::vector<float>& query,
                                      int k,
                                      const SearchFilter& filter = {});

  IndexStats get_indexed_stats();

  void save_external_content(const ExternalBlockContent& content);
  std::optional<ExternalBlockContent> get_external_content(const std::string& doc_id,
                                                           const std::string& block_id);

 private:
  void require_open() const;
  void rebuild_index();
  void remove_labels(const std::vector<faiss::idx_t>& labels);
  std::unique_ptr<faiss::IndexIDMap2> create_index() const;

  // Deletes rows matching `where` (bound to params) and their vectors. Caller holds the write lock.
  int delete_where(const std::string& operation,
                   const std::string& where,
                   const std::vector<std::string>& params);

  DatabaseManager& db_manager_;
  std::unique_ptr<faiss::IndexIDMap2> index_;
  int dimension_ = 0;
  mutable std::shared_mutex mutex_;
};

}  // namespace rag_core
