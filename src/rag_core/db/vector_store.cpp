#include "rag_core/db/vector_store.hpp"

#include <faiss/impl/IDSelector.h>
#include <faiss/utils/distances.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <iostream>
#include <mutex>
#include <set>
#include <sstream>
#include <unordered_map>

#include "rag_core/db/pooled_connection.hpp"
#include "rag_core/db/sqlite_error_utils.hpp"
#include "rag_core/db/transaction.hpp"
#include "rag_core/services/compression_service.hpp"

namespace rag_core {

namespace {

constexpr const char* kExternalTypesSql = "('bookmark', 'file', 'folder')";

// ID with any "_chunk_<n>" suffix removed.
constexpr const char* kBaseIdSql =
    "CASE WHEN instr(id, '_chunk_') > 0 THEN substr(id, 1, instr(id, '_chunk_') - 1) ELSE id END";

std::vector<char> to_blob(const std::vector<float>& vec) {
  std::vector<char> blob(vec.size() * sizeof(float));
  std::memcpy(blob.data(), vec.data(), blob.size());
  return blob;
}

std::vector<float> from_blob(const std::vector<char>& blob) {
  std::vector<float> vec(blob.size() / sizeof(float));
  std::memcpy(vec.data(), blob.data(), vec.size() * sizeof(float));
  return vec;
}

int64_t now_seconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string labels_to_comma_string(const std::vector<faiss::idx_t>& labels) {
  std::stringstream ss;
  for (size_t i = 0; i < labels.size(); ++i) {
    ss << labels[i];
    if (i < labels.size() - 1)
      ss << ",";
  }
  return ss.str();
}

std::string placeholders(size_t n) {
  std::string out;
  for (size_t i = 0; i < n; ++i) {
    out += (i == 0 ? "?" : ", ?");
  }
  return out;
}

}  // namespace

VectorStore::VectorStore(DatabaseManager& db_manager) : db_manager_(db_manager) {}

VectorStore::~VectorStore() = default;

bool VectorStore::open(int dimension) {
  if (dimension <= 0) {
    throw VectorStoreError("Invalid embedding dimension: " + std::to_string(dimension));
  }

  std::unique_lock lock(mutex_);
  bool cleared = false;
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, /*immediate*/ true);

    std::optional<int> stored;
    *conn << "SELECT value FROM vec_config WHERE key = 'dimension'" >>
        [&](std::string value) { stored = std::stoi(value); };

    if (stored && *stored != dimension) {
      std::cout << "[VectorStore] Embedding dimension changed from " << *stored << " to "
                << dimension << ", clearing stored vectors" << std::endl;
      *conn << "DELETE FROM vec_blocks";
      *conn << "DELETE FROM block_vectors";
      cleared = true;
    }
    *conn << "REPLACE INTO vec_config (key, value) VALUES ('dimension', ?)"
          << std::to_string(dimension);
    tx.commit();
  } catch (const sqlite::sqlite_exception& e) {
    throw VectorStoreError(format_db_error("open", e));
  }

  dimension_ = dimension;
  rebuild_index();
  return cleared;
}

int VectorStore::dimension() const {
  std::shared_lock lock(mutex_);
  return dimension_;
}

size_t VectorStore::size() const {
  std::shared_lock lock(mutex_);
  return index_ ? static_cast<size_t>(index_->ntotal) : 0;
}

void VectorStore::require_open() const {
  if (!index_) {
    throw VectorStoreError("Vector store has not been opened");
  }
}

std::unique_ptr<faiss::IndexIDMap2> VectorStore::create_index() const {
  auto index = std::make_unique<faiss::IndexIDMap2>(new faiss::IndexFlatIP(dimension_));
  index->own_fields = true;
  return index;
}

void VectorStore::rebuild_index() {
  auto index = create_index();

  std::vector<faiss::idx_t> labels;
  std::vector<float> flat;
  const size_t expected_bytes = static_cast<size_t>(dimension_) * sizeof(float);
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT label, embedding FROM vec_blocks" >>
        [&](int64_t label, std::vector<char> blob) {
          if (blob.size() != expected_bytes) {
            std::cerr << "Warning: [VectorStore] Skipping vector " << label
                      << " with mismatched size during index rebuild. Expected " << expected_bytes
                      << " bytes, got " << blob.size() << " bytes." << std::endl;
            return;
          }
          labels.push_back(label);
          const float* data = reinterpret_cast<const float*>(blob.data());
          flat.insert(flat.end(), data, data + dimension_);
        };
  } catch (const sqlite::sqlite_exception& e) {
    throw VectorStoreError(format_db_error("rebuild_index", e));
  }

  if (!labels.empty()) {
    const auto n = static_cast<faiss::idx_t>(labels.size());
    faiss::fvec_renorm_L2(dimension_, n, flat.data());
    index->add_with_ids(n, flat.data(), labels.data());
  }
  index_ = std::move(index);
}

void VectorStore::remove_labels(const std::vector<faiss::idx_t>& labels) {
  if (labels.empty() || !index_) {
    return;
  }
  faiss::IDSelectorBatch selector(labels.size(), labels.data());
  index_->remove_ids(selector);
}

void VectorStore::upsert(const BlockVector& block) {
  std::unique_lock lock(mutex_);
  require_open();

  if (block.embedding.size() != static_cast<size_t>(dimension_)) {
    throw VectorStoreError("Embedding size mismatch for block " + block.id + ". Expected " +
                           std::to_string(dimension_) + " dimensions, got " +
                           std::to_string(block.embedding.size()) + ".");
  }

  std::vector<faiss::idx_t> old_labels;
  faiss::idx_t new_label = -1;
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, /*immediate*/ true);

    *conn << "SELECT label FROM vec_blocks WHERE id = ?" << block.id >>
        [&](int64_t label) { old_labels.push_back(label); };

    *conn << "REPLACE INTO block_vectors (id, doc_id, content, content_hash, block_type, "
             "heading_context, source_block_id, file_path, updated_at) "
             "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)"
          << block.id << block.doc_id << block.content << block.content_hash << block.block_type
          << block.heading_context << block.source_block_id << block.file_path << now_seconds();

    // No native upsert for the vector row
    *conn << "DELETE FROM vec_blocks WHERE id = ?" << block.id;
    *conn << "INSERT INTO vec_blocks (id, embedding) VALUES (?, ?)" << block.id
          << to_blob(block.embedding);
    new_label = static_cast<faiss::idx_t>(conn->last_insert_rowid());

    tx.commit();
  } catch (const sqlite::sqlite_exception& e) {
    throw VectorStoreError(format_db_error("upsert", e));
  }

  std::vector<float> normalized = block.embedding;
  faiss::fvec_renorm_L2(dimension_, 1, normalized.data());
  remove_labels(old_labels);
  index_->add_with_ids(1, normalized.data(), &new_label);
}

std::map<std::string, std::string> VectorStore::get_block_hashes(const std::string& doc_id) {
  std::map<std::string, std::string> hashes;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, content_hash FROM block_vectors WHERE doc_id = ?" << doc_id >>
        [&](std::string id, std::string hash) { hashes.emplace(std::move(id), std::move(hash)); };
  } catch (const sqlite::sqlite_exception& e) {
    throw VectorStoreError(format_db_error("get_block_hashes", e));
  }
  return hashes;
}

int VectorStore::delete_where(const std::string& operation,
                              const std::string& where,
                              const std::vector<std::string>& params) {
  std::vector<faiss::idx_t> labels;
  int deleted = 0;
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, /*immediate*/ true);

    {
      auto select = *conn << "SELECT label FROM vec_blocks WHERE id IN "
                             "(SELECT id FROM block_vectors WHERE " + where + ")";
      for (const auto& p : params)
        select << p;
      select >> [&](int64_t label) { labels.push_back(label); };
    }
    {
      auto del_vectors = *conn << "DELETE FROM vec_blocks WHERE id IN "
                                  "(SELECT id FROM block_vectors WHERE " + where + ")";
      for (const auto& p : params)
        del_vectors << p;
      del_vectors.execute();
    }
    {
      auto del_rows = *conn << "DELETE FROM block_vectors WHERE " + where;
      for (const auto& p : params)
        del_rows << p;
      del_rows.execute();
    }
    deleted = conn->rows_modified();

    tx.commit();
  } catch (const sqlite::sqlite_exception& e) {
    throw VectorStoreError(format_db_error(operation, e));
  }

  remove_labels(labels);
  return deleted;
}

int VectorStore::delete_blocks(const std::vector<std::string>& ids) {
  if (ids.empty()) {
    return 0;
  }
  std::unique_lock lock(mutex_);
  require_open();
  return delete_where("delete_blocks", "id IN (" + placeholders(ids.size()) + ")", ids);
}

int VectorStore::delete_by_prefix(const std::string& prefix) {
  if (prefix.empty()) {
    throw VectorStoreError("delete_by_prefix requires a non-empty prefix");
  }
  std::unique_lock lock(mutex_);
  require_open();
  // substr instead of LIKE: IDs are full of '_' wildcards
  return delete_where("delete_by_prefix", "substr(id, 1, length(?)) = ?", {prefix, prefix});
}

int VectorStore::delete_by_doc_id(const std::string& doc_id) {
  std::unique_lock lock(mutex_);
  require_open();
  int deleted = delete_where("delete_by_doc_id", "doc_id = ?", {doc_id});
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM external_contents WHERE doc_id = ?" << doc_id;
  } catch (const sqlite::sqlite_exception& e) {
    throw VectorStoreError(format_db_error("delete_by_doc_id", e));
  }
  return deleted;
}

int VectorStore::delete_non_external_by_doc_id(const std::string& doc_id) {
  std::unique_lock lock(mutex_);
  require_open();
  return delete_where("delete_non_external_by_doc_id",
                      std::string("doc_id = ? AND block_type NOT IN ") + kExternalTypesSql,
                      {doc_id});
}

std::vector<std::string> VectorStore::delete_orphan_external(
    const std::string& doc_id,
    const std::string& block_type,
    const std::vector<std::string>& keep_block_ids) {
  std::unique_lock lock(mutex_);
  require_open();

  std::string where = "doc_id = ? AND block_type = ?";
  std::vector<std::string> params = {doc_id, block_type};
  if (!keep_block_ids.empty()) {
    where += " AND source_block_id NOT IN (" + placeholders(keep_block_ids.size()) + ")";
    params.insert(params.end(), keep_block_ids.begin(), keep_block_ids.end());
  }

  std::set<std::string> removed_blocks;
  std::set<std::string> file_paths;
  try {
    PooledConnection conn(db_manager_);
    auto select = *conn << "SELECT source_block_id, file_path FROM block_vectors WHERE " +
                               where;
    for (const auto& p : params)
      select << p;
    select >> [&](std::string source_block_id, std::string file_path) {
      removed_blocks.insert(std::move(source_block_id));
      if (!file_path.empty())
        file_paths.insert(std::move(file_path));
    };
  } catch (const sqlite::sqlite_exception& e) {
    throw VectorStoreError(format_db_error("delete_orphan_external", e));
  }

  if (removed_blocks.empty()) {
    return {};
  }

  delete_where("delete_orphan_external", where, params);
  try {
    PooledConnection conn(db_manager_);
    for (const auto& block_id : removed_blocks) {
      *conn << "DELETE FROM external_contents WHERE doc_id = ? AND block_id = ?" << doc_id
            << block_id;
    }
  } catch (const sqlite::sqlite_exception& e) {
    throw VectorStoreError(format_db_error("delete_orphan_external", e));
  }

  if (block_type != kFileType) {
    return {};
  }
  return {file_paths.begin(), file_paths.end()};
}

std::vector<std::string> VectorStore::get_all_doc_ids() {
  std::vector<std::string> ids;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT DISTINCT doc_id FROM block_vectors ORDER BY doc_id" >>
        [&](std::string id) { ids.push_back(std::move(id)); };
  } catch (const sqlite::sqlite_exception& e) {
    throw VectorStoreError(format_db_error("get_all_doc_ids", e));
  }
  return ids;
}

std::vector<BlockVector> VectorStore::get_document_vectors(const std::string& doc_id) {
  std::vector<BlockVector> blocks;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT b.id, b.source_block_id, b.content, b.content_hash, b.block_type, "
             "b.heading_context, b.file_path, v.embedding FROM block_vectors b "
             "JOIN vec_blocks v ON v.id = b.id WHERE b.doc_id = ? ORDER BY v.label"
          << doc_id >>
        [&](std::string id, std::string source_block_id, std::string content, std::string hash,
            std::string block_type, std::string heading_context, std::string file_path,
            std::vector<char> embedding) {
          BlockVector block;
          block.id = std::move(id);
          block.source_block_id = std::move(source_block_id);
          block.doc_id = doc_id;
          block.content = std::move(content);
          block.content_hash = std::move(hash);
          block.block_type = std::move(block_type);
          block.heading_context = std::move(heading_context);
          block.file_path = std::move(file_path);
          block.embedding = from_blob(embedding);
          blocks.push_back(std::move(block));
        };
  } catch (const sqlite::sqlite_exception& e) {
    throw VectorStoreError(format_db_error("get_document_vectors", e));
  }
  return blocks;
}

std::vector<EntityVectors> VectorStore::get_entity_vectors() {
  std::vector<EntityVectors> entities;
  std::unordered_map<std::string, size_t> positions;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT b.doc_id, b.block_type, b.source_block_id, b.heading_context, "
             "COALESCE(e.title, ''), v.embedding FROM block_vectors b "
             "JOIN vec_blocks v ON v.id = b.id "
             "LEFT JOIN external_contents e ON e.doc_id = b.doc_id AND e.block_id = b.source_block_id "
             "ORDER BY b.doc_id, v.label" >>
        [&](std::string doc_id, std::string block_type, std::string source_block_id,
            std::string heading_context, std::string snapshot_title, std::vector<char> embedding) {
          const bool external = is_external_type(block_type);
          const std::string key =
              external ? doc_id + "_" + source_block_id + "_" + block_type : doc_id;

          auto it = positions.find(key);
          if (it == positions.end()) {
            EntityVectors entity;
            entity.entity_id = key;
            entity.doc_id = doc_id;
            if (external) {
              entity.source_block_id = source_block_id;
              entity.block_type = block_type;
              entity.title = snapshot_title.empty() ? heading_context : snapshot_title;
            }
            it = positions.emplace(key, entities.size()).first;
            entities.push_back(std::move(entity));
          }
          entities[it->second].vectors.push_back(from_blob(embedding));
        };
  } catch (const sqlite::sqlite_exception& e) {
    throw VectorStoreError(format_db_error("get_entity_vectors", e));
  }
  return entities;
}

std::vector<VectorSearchHit> VectorStore::search(const std::vector<float>& query,
                                                 int k,
                                                 const SearchFilter& filter) {
  std::shared_lock lock(mutex_);
  require_open();

  if (query.size() != static_cast<size_t>(dimension_)) {
    throw VectorStoreError("Query vector dimension mismatch. Expected " +
                           std::to_string(dimension_) + ", got " + std::to_string(query.size()));
  }
  if (k <= 0 || index_->ntotal == 0) {
    return {};
  }

  // Filters are resolved to faiss labels through SQL
  std::vector<faiss::idx_t> filter_labels;
  const bool positive = !filter.doc_id.empty() || !filter.source_block_id.empty();
  if (!filter.empty()) {
    std::string where;
    std::vector<std::string> params;
    auto add = [&](const std::string& clause, const std::string& value) {
      where += where.empty() ? clause : " AND " + clause;
      params.push_back(value);
    };
    if (positive) {
      if (!filter.doc_id.empty())
        add("doc_id = ?", filter.doc_id);
      if (!filter.source_block_id.empty())
        add("source_block_id = ?", filter.source_block_id);
      if (!filter.exclude_doc_id.empty())
        add("doc_id != ?", filter.exclude_doc_id);
    } else {
      add("doc_id = ?", filter.exclude_doc_id);
    }

    try {
      PooledConnection conn(db_manager_);
      auto select = *conn << "SELECT label FROM vec_blocks WHERE id IN "
                             "(SELECT id FROM block_vectors WHERE " + where + ")";
      for (const auto& p : params)
        select << p;
      select >> [&](int64_t label) { filter_labels.push_back(label); };
    } catch (const sqlite::sqlite_exception& e) {
      throw VectorStoreError(format_db_error("search", e));
    }
    if (positive && filter_labels.empty()) {
      return {};
    }
  }

  faiss::idx_t candidates = index_->ntotal;
  if (positive) {
    candidates = static_cast<faiss::idx_t>(filter_labels.size());
  } else if (!filter.exclude_doc_id.empty()) {
    candidates -= static_cast<faiss::idx_t>(filter_labels.size());
  }
  const faiss::idx_t actual_k = std::min<faiss::idx_t>(k, candidates);
  if (actual_k <= 0) {
    return {};
  }

  std::vector<float> normalized = query;
  faiss::fvec_renorm_L2(dimension_, 1, normalized.data());

  std::vector<float> scores(actual_k);
  std::vector<faiss::idx_t> labels(actual_k);

  std::unique_ptr<faiss::IDSelectorBatch> batch;
  std::unique_ptr<faiss::IDSelectorNot> negation;
  faiss::SearchParameters params;
  if (!filter.empty()) {
    batch = std::make_unique<faiss::IDSelectorBatch>(filter_labels.size(), filter_labels.data());
    if (positive) {
      params.sel = batch.get();
    } else {
      negation = std::make_unique<faiss::IDSelectorNot>(batch.get());
      params.sel = negation.get();
    }
  }
  index_->search(1, normalized.data(), actual_k, scores.data(), labels.data(),
                 filter.empty() ? nullptr : &params);

  std::vector<faiss::idx_t> found;
  for (auto label : labels) {
    if (label != -1)
      found.push_back(label);
  }
  if (found.empty()) {
    return {};
  }

  std::unordered_map<faiss::idx_t, VectorSearchHit> by_label;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT v.label, b.id, b.doc_id, b.content, b.block_type, b.heading_context, "
             "b.source_block_id FROM vec_blocks v JOIN block_vectors b ON b.id = v.id "
             "WHERE v.label IN (" + labels_to_comma_string(found) + ")" >>
        [&](int64_t label, std::string id, std::string doc_id, std::string content,
            std::string block_type, std::string heading_context, std::string source_block_id) {
          VectorSearchHit hit;
          hit.id = std::move(id);
          hit.doc_id = std::move(doc_id);
          hit.content = std::move(content);
          hit.block_type = std::move(block_type);
          hit.heading_context = std::move(heading_context);
          hit.source_block_id = std::move(source_block_id);
          by_label.emplace(label, std::move(hit));
        };
  } catch (const sqlite::sqlite_exception& e) {
    throw VectorStoreError(format_db_error("search", e));
  }

  std::vector<VectorSearchHit> hits;
  hits.reserve(found.size());
  for (faiss::idx_t i = 0; i < actual_k; ++i) {
    if (labels[i] == -1)
      continue;
    auto it = by_label.find(labels[i]);
    if (it == by_label.end()) {
      std::cerr << "Warning: [VectorStore] faiss returned label " << labels[i]
                << " but no corresponding metadata found in DB." << std::endl;
      continue;
    }
    VectorSearchHit hit = std::move(it->second);
    hit.distance = std::max(0.0f, 1.0f - scores[i]);
    hits.push_back(std::move(hit));
  }
  return hits;
}

IndexStats VectorStore::get_indexed_stats() {
  IndexStats stats;
  try {
    PooledConnection conn(db_manager_);
    *conn << std::string("SELECT COUNT(DISTINCT doc_id) FROM block_vectors WHERE block_type NOT IN ") +
                 kExternalTypesSql >>
        stats.documents;
    *conn << std::string("SELECT COUNT(DISTINCT ") + kBaseIdSql +
                 ") FROM block_vectors WHERE block_type = 'bookmark'" >>
        stats.bookmarks;
    *conn << std::string("SELECT COUNT(DISTINCT ") + kBaseIdSql +
                 ") FROM block_vectors WHERE block_type = 'file'" >>
        stats.files;
    *conn << "SELECT COUNT(DISTINCT doc_id || '|' || source_block_id) FROM block_vectors "
             "WHERE block_type = 'folder'" >>
        stats.folders;
  } catch (const sqlite::sqlite_exception& e) {
    throw VectorStoreError(format_db_error("get_indexed_stats", e));
  }
  return stats;
}

void VectorStore::save_external_content(const ExternalBlockContent& content) {
  std::vector<char> compressed = CompressionService::compress(content.raw_content);
  try {
    PooledConnection conn(db_manager_);
    *conn << "REPLACE INTO external_contents (id, doc_id, block_id, block_type, url, file_path, "
             "title, raw_content, extracted_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)"
          << content.id << content.doc_id << content.block_id << content.block_type << content.url
          << content.file_path << content.title << compressed
          << (content.extracted_at > 0 ? content.extracted_at : now_seconds());
  } catch (const sqlite::sqlite_exception& e) {
    throw VectorStoreError(format_db_error("save_external_content", e));
  }
}

std::optional<ExternalBlockContent> VectorStore::get_external_content(const std::string& doc_id,
                                                                      const std::string& block_id) {
  std::optional<ExternalBlockContent> result;
  std::vector<char> compressed;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, block_type, url, file_path, title, raw_content, extracted_at "
             "FROM external_contents WHERE doc_id = ? AND block_id = ?"
          << doc_id << block_id >>
        [&](std::string id, std::string block_type, std::string url, std::string file_path,
            std::string title, std::optional<std::vector<char>> raw, int64_t extracted_at) {
          ExternalBlockContent content;
          content.id = std::move(id);
          content.doc_id = doc_id;
          content.block_id = block_id;
          content.block_type = std::move(block_type);
          content.url = std::move(url);
          content.file_path = std::move(file_path);
          content.title = std::move(title);
          content.extracted_at = extracted_at;
          if (raw)
            compressed = std::move(*raw);
          result = std::move(content);
        };
  } catch (const sqlite::sqlite_exception& e) {
    throw VectorStoreError(format_db_error("get_external_content", e));
  }

  if (result) {
    try {
      result->raw_content = CompressionService::decompress(compressed);
    } catch (const std::runtime_error& e) {
      throw VectorStoreError("get_external_content failed for " + result->id + ": " + e.what());
    }
  }
  return result;
}

}  // namespace rag_core
