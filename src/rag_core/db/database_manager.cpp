#include "rag_core/db/database_manager.hpp"

#include <stdexcept>

namespace rag_core {

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::initialize(const std::filesystem::path& db_path, int pool_size) {
  if (is_initialized_) {
    return;
  }

  if (db_path.has_parent_path()) {
    std::filesystem::create_directories(db_path.parent_path());
  }

  // Schema first, on a single non-pooled connection
  setup_schema(db_path);
  pool_ = std::make_unique<ConnectionPool>(db_path.string(), pool_size);

  db_path_ = db_path;
  is_initialized_ = true;
}

void DatabaseManager::shutdown() {
  if (!is_initialized_) {
    return;
  }
  pool_->shutdown();
  is_initialized_ = false;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (!is_initialized_) {
    throw std::runtime_error("DatabaseManager has not been initialized.");
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (!is_initialized_) {
    return;
  }
  pool_->return_connection(std::move(conn));
}

void DatabaseManager::setup_schema(const std::filesystem::path& db_path) {
  sqlite::database db(db_path.string());
  db << "PRAGMA journal_mode = WAL;";

  db << R"(
      CREATE TABLE IF NOT EXISTS block_vectors (
          id TEXT PRIMARY KEY,
          doc_id TEXT NOT NULL,
          content TEXT NOT NULL,
          content_hash TEXT NOT NULL,
          block_type TEXT NOT NULL DEFAULT '',
          heading_context TEXT NOT NULL DEFAULT '',
          source_block_id TEXT NOT NULL DEFAULT '',
          file_path TEXT NOT NULL DEFAULT '',
          updated_at INTEGER NOT NULL
      )
    )";
  db << "CREATE INDEX IF NOT EXISTS idx_block_vectors_doc_id ON block_vectors(doc_id)";

  // Authoritative vectors. label is the faiss id.
  db << R"(
      CREATE TABLE IF NOT EXISTS vec_blocks (
          label INTEGER PRIMARY KEY AUTOINCREMENT,
          id TEXT UNIQUE NOT NULL,
          embedding BLOB NOT NULL
      )
    )";

  db << R"(
      CREATE TABLE IF NOT EXISTS vec_config (
          key TEXT PRIMARY KEY,
          value TEXT NOT NULL
      )
    )";

  db << R"(
      CREATE TABLE IF NOT EXISTS external_contents (
          id TEXT PRIMARY KEY,
          doc_id TEXT NOT NULL,
          block_id TEXT NOT NULL,
          block_type TEXT NOT NULL,
          url TEXT NOT NULL DEFAULT '',
          file_path TEXT NOT NULL DEFAULT '',
          title TEXT NOT NULL DEFAULT '',
          raw_content BLOB,
          extracted_at INTEGER NOT NULL
      )
    )";
  db << "CREATE INDEX IF NOT EXISTS idx_external_contents_doc_id ON external_contents(doc_id)";
}

}  // namespace rag_core
