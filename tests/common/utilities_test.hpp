#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "rag_core/db/database_manager.hpp"
#include "rag_core/db/vector_store.hpp"
#include "rag_core/types/block_vector.hpp"

namespace rag_tests {

/**
 * Utility class providing common functionality for all tests
 */
class TestUtilities {
 public:
  // Fresh directory under the system temp dir, unique per call
  static std::filesystem::path create_temp_dir(const std::string& prefix = "rag_tests");
  static void cleanup_temp_dir(const std::filesystem::path& dir);

  static void write_file(const std::filesystem::path& path, const std::string& contents);

  // Editor block JSON builders
  static std::string paragraph(const std::string& id, const std::string& text);
  static std::string heading(const std::string& id, const std::string& text, int level = 1);
  static std::string list_item(const std::string& id, const std::string& text,
                               const std::string& type = "bulletListItem");
  static std::string block(const std::string& id, const std::string& type,
                           const std::string& props_json = "{}");
  static std::string document(const std::vector<std::string>& blocks);

  static std::vector<float> unit_vector(int dimension, int hot_index);

  static rag_core::BlockVector create_block_vector(const std::string& id,
                                                   const std::string& doc_id,
                                                   const std::vector<float>& embedding,
                                                   const std::string& block_type = "paragraph",
                                                   const std::string& content = "content");
};

/**
 * Base test fixture that opens a VectorStore on a fresh temporary database
 */
class VectorStoreTestBase : public ::testing::Test {
 protected:
  static constexpr int kDimension = 8;

  void SetUp() override {
    temp_dir_ = TestUtilities::create_temp_dir();
    db_manager_ = std::make_unique<rag_core::DatabaseManager>();
    db_manager_->initialize(temp_dir_ / "rag.db", /*pool_size*/ 4);
    store_ = std::make_shared<rag_core::VectorStore>(*db_manager_);
    store_->open(kDimension);
  }

  void TearDown() override {
    store_.reset();
    db_manager_->shutdown();
    db_manager_.reset();
    TestUtilities::cleanup_temp_dir(temp_dir_);
  }

  std::filesystem::path temp_dir_;
  std::unique_ptr<rag_core::DatabaseManager> db_manager_;
  std::shared_ptr<rag_core::VectorStore> store_;
};

}  // namespace rag_tests
