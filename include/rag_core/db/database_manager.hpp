#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "rag_core/db/connection_pool.hpp"

namespace rag_core {

/**
 * @class DatabaseManager
 * @brief Owns the schema setup and the connection pool of one database file.
 *
 * One instance is created per service lifetime and passed by reference to the
 * stores that need it.
 */
class DatabaseManager {
 public:
  DatabaseManager() = default;
  ~DatabaseManager();

  DatabaseManager(const DatabaseManager&) = delete;
  DatabaseManager& operator=(const DatabaseManager&) = delete;

  // Creates parent directories and the schema, then opens the pool.
  void initialize(const std::filesystem::path& db_path, int pool_size);

  // Used by the PooledConnection guard
  std::unique_ptr<sqlite::database> get_connection();
  void return_connection(std::unique_ptr<sqlite::database> conn);

  void shutdown();

  bool is_initialized() const { return is_initialized_; }
  const std::filesystem::path& db_path() const { return db_path_; }

 private:
  void setup_schema(const std::filesystem::path& db_path);

  std::unique_ptr<ConnectionPool> pool_;
  std::filesystem::path db_path_;
  bool is_initialized_ = false;
};

}  // namespace rag_core
