#include <gtest/gtest.h>

#include "../../common/utilities_test.hpp"
#include "rag_core/db/pooled_connection.hpp"

namespace rag_core {

using rag_tests::TestUtilities;

class VectorStoreTest : public rag_tests::VectorStoreTestBase {
 protected:
  std::vector<float> vec(int hot) { return TestUtilities::unit_vector(kDimension, hot); }

  void add(const std::string& id, const std::string& doc_id, int hot,
           const std::string& type = "paragraph", const std::string& source = "") {
    auto row = TestUtilities::create_block_vector(id, doc_id, vec(hot), type);
    if (!source.empty())
      row.source_block_id = source;
    store_->upsert(row);
  }

  int count_rows(const std::string& table) {
    PooledConnection conn(*db_manager_);
    int count = 0;
    *conn << "SELECT COUNT(*) FROM " + table >> count;
    return count;
  }
};

TEST_F(VectorStoreTest, IdenticalVectorIsNearestWithZeroDistance) {
  add("b1", "doc1", 0);
  add("b2", "doc1", 1);

  auto hits = store_->search(vec(0), 2);

  ASSERT_EQ(hits.size(), 2u);
  EXPECT_EQ(hits[0].id, "b1");
  EXPECT_NEAR(hits[0].distance, 0.0f, 1e-5);
  EXPECT_NEAR(hits[1].distance, 1.0f, 1e-5);
  EXPECT_EQ(hits[0].doc_id, "doc1");
  EXPECT_EQ(hits[0].content, "content");
}

TEST_F(VectorStoreTest, UpsertRejectsDimensionMismatch) {
  auto row = TestUtilities::create_block_vector("b1", "doc1", std::vector<float>(3, 1.0f));
  EXPECT_THROW(store_->upsert(row), VectorStoreError);
  EXPECT_EQ(store_->size(), 0u);
}

TEST_F(VectorStoreTest, UpsertReplacesExistingRow) {
  add("b1", "doc1", 0);
  add("b1", "doc1", 3);

  EXPECT_EQ(store_->size(), 1u);
  EXPECT_EQ(count_rows("block_vectors"), 1);
  auto hits = store_->search(vec(3), 1);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_NEAR(hits[0].distance, 0.0f, 1e-5);
}

TEST_F(VectorStoreTest, SearchRejectsQueryOfWrongDimension) {
  add("b1", "doc1", 0);
  EXPECT_THROW(store_->search(std::vector<float>(2, 0.5f), 1), VectorStoreError);
}

TEST_F(VectorStoreTest, SearchOnEmptyStoreReturnsNothing) {
  EXPECT_TRUE(store_->search(vec(0), 5).empty());
}

TEST_F(VectorStoreTest, FiltersRestrictAndExcludeDocuments) {
  add("a1", "docA", 0);
  add("a2", "docA", 1);
  add("b1", "docB", 0, "paragraph", "src-b");

  auto only_a = store_->search(vec(0), 10, {.doc_id = "docA"});
  ASSERT_EQ(only_a.size(), 2u);
  for (const auto& hit : only_a)
    EXPECT_EQ(hit.doc_id, "docA");

  auto without_a = store_->search(vec(0), 10, {.exclude_doc_id = "docA"});
  ASSERT_EQ(without_a.size(), 1u);
  EXPECT_EQ(without_a[0].id, "b1");

  auto by_source = store_->search(vec(0), 10, {.source_block_id = "src-b"});
  ASSERT_EQ(by_source.size(), 1u);
  EXPECT_EQ(by_source[0].source_block_id, "src-b");

  EXPECT_TRUE(store_->search(vec(0), 10, {.doc_id = "missing"}).empty());
}

TEST_F(VectorStoreTest, ReopenWithNewDimensionClearsVectorsButKeepsSnapshots) {
  add("b1", "doc1", 0);
  store_->save_external_content({.id = "doc1_bm",
                                 .doc_id = "doc1",
                                 .block_id = "bm",
                                 .block_type = "bookmark",
                                 .url = "https://example.com",
                                 .title = "Example",
                                 .raw_content = "page text"});

  EXPECT_FALSE(store_->open(kDimension));
  EXPECT_EQ(store_->size(), 1u);

  EXPECT_TRUE(store_->open(16));
  EXPECT_EQ(store_->dimension(), 16);
  EXPECT_EQ(store_->size(), 0u);
  EXPECT_EQ(count_rows("block_vectors"), 0);
  EXPECT_EQ(count_rows("vec_blocks"), 0);
  EXPECT_TRUE(store_->get_external_content("doc1", "bm").has_value());
}

TEST_F(VectorStoreTest, IndexIsRebuiltFromDatabaseOnOpen) {
  add("b1", "doc1", 2);
  add("b2", "doc1", 5);

  VectorStore reopened(*db_manager_);
  EXPECT_FALSE(reopened.open(kDimension));
  EXPECT_EQ(reopened.size(), 2u);

  auto hits = reopened.search(vec(5), 1);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].id, "b2");
}

TEST_F(VectorStoreTest, DeleteByPrefixTreatsUnderscoresLiterally) {
  add("d_b_bookmark_chunk_0", "d", 0, "bookmark");
  add("d_b_bookmark_chunk_1", "d", 1, "bookmark");
  add("dxbxbookmark_chunk_0", "d", 2, "bookmark");

  EXPECT_EQ(store_->delete_by_prefix("d_b_bookmark"), 2);
  EXPECT_EQ(store_->size(), 1u);
  EXPECT_EQ(store_->get_block_hashes("d").count("dxbxbookmark_chunk_0"), 1u);
  EXPECT_THROW(store_->delete_by_prefix(""), VectorStoreError);
}

TEST_F(VectorStoreTest, DeleteNonExternalKeepsExternalRows) {
  add("p1", "doc1", 0);
  add("doc1_bm_bookmark_chunk_0", "doc1", 1, "bookmark", "bm");
  add("doc1_f_file_chunk_0", "doc1", 2, "file", "f");

  EXPECT_EQ(store_->delete_non_external_by_doc_id("doc1"), 1);

  auto hashes = store_->get_block_hashes("doc1");
  EXPECT_EQ(hashes.size(), 2u);
  EXPECT_EQ(hashes.count("p1"), 0u);
  EXPECT_EQ(store_->size(), 2u);
}

TEST_F(VectorStoreTest, DeleteByDocIdRemovesRowsAndSnapshots) {
  add("p1", "doc1", 0);
  add("p2", "doc2", 1);
  store_->save_external_content({.id = "doc1_bm", .doc_id = "doc1", .block_id = "bm",
                                 .block_type = "bookmark", .raw_content = "x"});

  EXPECT_EQ(store_->delete_by_doc_id("doc1"), 1);
  EXPECT_FALSE(store_->get_external_content("doc1", "bm").has_value());
  EXPECT_EQ(store_->get_all_doc_ids(), std::vector<std::string>{"doc2"});
}

TEST_F(VectorStoreTest, DeleteOrphanExternalReturnsFilePathsOfRemovedFiles) {
  auto kept = TestUtilities::create_block_vector("doc1_f1_file_chunk_0", "doc1", vec(0), "file");
  kept.source_block_id = "f1";
  kept.file_path = "/files/kept.txt";
  auto orphan = TestUtilities::create_block_vector("doc1_f2_file_chunk_0", "doc1", vec(1), "file");
  orphan.source_block_id = "f2";
  orphan.file_path = "/files/orphan.txt";
  store_->upsert(kept);
  store_->upsert(orphan);
  store_->save_external_content({.id = "doc1_f2", .doc_id = "doc1", .block_id = "f2",
                                 .block_type = "file", .raw_content = "gone"});

  auto paths = store_->delete_orphan_external("doc1", kFileType, {"f1"});

  EXPECT_EQ(paths, std::vector<std::string>{"/files/orphan.txt"});
  EXPECT_EQ(store_->size(), 1u);
  EXPECT_FALSE(store_->get_external_content("doc1", "f2").has_value());
  EXPECT_TRUE(store_->delete_orphan_external("doc1", kFileType, {"f1"}).empty());
}

TEST_F(VectorStoreTest, DeleteOrphanExternalWithNoKeepersRemovesAllOfThatType) {
  add("doc1_b1_bookmark_chunk_0", "doc1", 0, "bookmark", "b1");
  add("doc1_f1_file_chunk_0", "doc1", 1, "file", "f1");

  auto paths = store_->delete_orphan_external("doc1", kBookmarkType, {});

  EXPECT_TRUE(paths.empty());
  EXPECT_EQ(store_->size(), 1u);
  EXPECT_EQ(store_->get_block_hashes("doc1").count("doc1_f1_file_chunk_0"), 1u);
}

TEST_F(VectorStoreTest, StatsCountDistinctSources) {
  add("p1", "doc1", 0);
  add("p2", "doc1", 1);
  add("q1", "doc2", 2);
  add("doc1_b_bookmark_chunk_0", "doc1", 3, "bookmark", "b");
  add("doc1_b_bookmark_chunk_1", "doc1", 4, "bookmark", "b");
  add("doc1_f_file_chunk_0", "doc1", 5, "file", "f");
  add("doc1_fo_folder_0_chunk_0", "doc1", 6, "folder", "fo");
  add("doc1_fo_folder_1_chunk_0", "doc1", 7, "folder", "fo");

  auto stats = store_->get_indexed_stats();

  EXPECT_EQ(stats.documents, 2);
  EXPECT_EQ(stats.bookmarks, 1);
  EXPECT_EQ(stats.files, 1);
  EXPECT_EQ(stats.folders, 1);
}

TEST_F(VectorStoreTest, ExternalContentIsStoredCompressed) {
  const std::string body(4096, 'z');
  store_->save_external_content({.id = "doc1_f",
                                 .doc_id = "doc1",
                                 .block_id = "f",
                                 .block_type = "file",
                                 .file_path = "/tmp/f.txt",
                                 .title = "f.txt",
                                 .raw_content = body,
                                 .extracted_at = 1700000000});

  {
    PooledConnection conn(*db_manager_);
    std::vector<char> raw;
    *conn << "SELECT raw_content FROM external_contents WHERE id = 'doc1_f'" >> raw;
    EXPECT_LT(raw.size(), body.size());
  }

  auto loaded = store_->get_external_content("doc1", "f");
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->raw_content, body);
  EXPECT_EQ(loaded->file_path, "/tmp/f.txt");
  EXPECT_EQ(loaded->extracted_at, 1700000000);
  EXPECT_FALSE(store_->get_external_content("doc1", "missing").has_value());
}

TEST_F(VectorStoreTest, EntityVectorsGroupExternalBlocksSeparately) {
  add("p1", "doc1", 0);
  add("p2", "doc1", 1);
  auto bm = TestUtilities::create_block_vector("doc1_bm_bookmark_chunk_0", "doc1", vec(2), "bookmark");
  bm.source_block_id = "bm";
  bm.heading_context = "Fallback title";
  store_->upsert(bm);

  auto entities = store_->get_entity_vectors();

  ASSERT_EQ(entities.size(), 2u);
  const auto& doc = entities[0].entity_id == "doc1" ? entities[0] : entities[1];
  const auto& ext = entities[0].entity_id == "doc1" ? entities[1] : entities[0];
  EXPECT_EQ(doc.vectors.size(), 2u);
  EXPECT_TRUE(doc.block_type.empty());
  EXPECT_EQ(ext.entity_id, "doc1_bm_bookmark");
  EXPECT_EQ(ext.title, "Fallback title");
  EXPECT_EQ(ext.source_block_id, "bm");
}

}  // namespace rag_core
