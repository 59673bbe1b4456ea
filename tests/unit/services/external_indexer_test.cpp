#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"
#include "rag_core/services/external_indexer.hpp"

using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

namespace rag_core {

using rag_tests::TestUtilities;

class ExternalIndexerTest : public rag_tests::VectorStoreTestBase {
 protected:
  void SetUp() override {
    VectorStoreTestBase::SetUp();
    data_dir_ = temp_dir_ / "data";
    std::filesystem::create_directories(data_dir_);
    repository_ = std::make_shared<rag_tests::InMemoryDocumentRepository>();
    embedder_ = std::make_shared<rag_tests::HashEmbedder>(kDimension);
    fetcher_ = std::make_shared<rag_tests::MockWebContentFetcher>();
    indexer_ = std::make_unique<ExternalIndexer>(store_, embedder_, repository_,
                                                 std::make_shared<PlainTextExtractor>(), fetcher_, data_dir_);
  }

  std::filesystem::path data_dir_;
  std::shared_ptr<rag_tests::InMemoryDocumentRepository> repository_;
  std::shared_ptr<rag_tests::HashEmbedder> embedder_;
  std::shared_ptr<rag_tests::MockWebContentFetcher> fetcher_;
  std::unique_ptr<ExternalIndexer> indexer_;
};

TEST_F(ExternalIndexerTest, BookmarkChunksCarryBlockAndTitle) {
  EXPECT_CALL(*fetcher_, fetch_content("https://example.com/post"))
      .WillOnce(Return(WebContent{"Post", "Example", "First paragraph.\n\nSecond paragraph."}));

  const int stored = indexer_->index_bookmark("https://example.com/post", "doc1", "bm");

  EXPECT_EQ(stored, 1);
  auto hits = store_->search(embedder_->embed("First paragraph.\n\nSecond paragraph."), 1);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].id, "doc1_bm_bookmark_chunk_0");
  EXPECT_EQ(hits[0].source_block_id, "bm");
  EXPECT_EQ(hits[0].block_type, "bookmark");
  EXPECT_EQ(hits[0].heading_context, "Post - Example");

  auto snapshot = store_->get_external_content("doc1", "bm");
  ASSERT_TRUE(snapshot.has_value());
  EXPECT_EQ(snapshot->id, "doc1_bm");
  EXPECT_EQ(snapshot->url, "https://example.com/post");
  EXPECT_EQ(snapshot->raw_content, "First paragraph.\n\nSecond paragraph.");
}

TEST_F(ExternalIndexerTest, ReindexingBookmarkReplacesOldChunks) {
  ChunkConfig small;
  small.max_merged_length = 10;
  indexer_->set_chunk_config(small);
  EXPECT_CALL(*fetcher_, fetch_content(_))
      .WillOnce(Return(WebContent{"T", "", "one para\n\ntwo para\n\nthree para"}))
      .WillOnce(Return(WebContent{"T", "", "only one"}));

  EXPECT_EQ(indexer_->index_bookmark("https://x", "doc1", "bm"), 3);
  EXPECT_EQ(indexer_->index_bookmark("https://x", "doc1", "bm"), 1);
  EXPECT_EQ(store_->size(), 1u);
}

TEST_F(ExternalIndexerTest, EmptyPageIsAContentError) {
  EXPECT_CALL(*fetcher_, fetch_content(_)).WillOnce(Return(WebContent{"Empty", "", "   "}));
  EXPECT_THROW(indexer_->index_bookmark("https://x", "doc1", "bm"), ContentSourceError);
}

TEST_F(ExternalIndexerTest, FileUnderDataDirectoryIsResolvedAndIndexed) {
  TestUtilities::write_file(data_dir_ / "files" / "notes.md", "# Notes\n\nSome attached text.");

  const int stored = indexer_->index_file("/files/notes.md", "doc1", "f1", "My notes");

  EXPECT_EQ(stored, 1);
  auto rows = store_->get_document_vectors("doc1");
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].id, "doc1_f1_file_chunk_0");
  EXPECT_EQ(rows[0].heading_context, "My notes");
  EXPECT_EQ(rows[0].file_path, "/files/notes.md");
  EXPECT_EQ(rows[0].source_block_id, "f1");
}

TEST_F(ExternalIndexerTest, MissingOrUnsupportedFileFails) {
  EXPECT_THROW(indexer_->index_file("/files/missing.txt", "doc1", "f1"), ContentSourceError);

  TestUtilities::write_file(data_dir_ / "files" / "scan.pdf", "%PDF-1.7");
  EXPECT_THROW(indexer_->index_file("/files/scan.pdf", "doc1", "f1"), ContentSourceError);
  EXPECT_EQ(store_->size(), 0u);
}

TEST_F(ExternalIndexerTest, AbsolutePathIsUsedAsIs) {
  const auto outside = temp_dir_ / "outside.txt";
  TestUtilities::write_file(outside, "outside text");
  EXPECT_EQ(indexer_->resolve_path(outside.string()), outside);
  EXPECT_EQ(indexer_->resolve_path("/files/a.txt"), data_dir_ / "files/a.txt");
  EXPECT_EQ(indexer_->resolve_path("rel/b.txt"), data_dir_ / "rel/b.txt");
}

TEST_F(ExternalIndexerTest, FolderWalkSkipsHiddenAndVendoredDirectories) {
  const auto root = temp_dir_ / "project";
  TestUtilities::write_file(root / "a.txt", "file a");
  TestUtilities::write_file(root / "b.md", "file b");
  TestUtilities::write_file(root / "f.pdf", "%PDF");
  TestUtilities::write_file(root / "img.png", "png");
  TestUtilities::write_file(root / "sub" / "e.txt", "file e");
  TestUtilities::write_file(root / ".hidden" / "h.txt", "hidden");
  TestUtilities::write_file(root / "node_modules" / "n.txt", "module");

  auto result = indexer_->index_folder(root.string(), "doc1", "fo");

  EXPECT_EQ(result.total_files, 4);
  EXPECT_EQ(result.success_count, 3);
  EXPECT_EQ(result.failed_count, 1);
  EXPECT_EQ(result.failed_files, std::vector<std::string>{"f.pdf"});

  auto rows = store_->get_document_vectors("doc1");
  ASSERT_EQ(rows.size(), 3u);
  EXPECT_EQ(rows[0].id, "doc1_fo_folder_0_chunk_0");
  EXPECT_EQ(rows[0].heading_context, "project/a.txt");
  EXPECT_EQ(rows[2].id, "doc1_fo_folder_3_chunk_0");

  auto snapshot = store_->get_external_content("doc1", "fo");
  ASSERT_TRUE(snapshot.has_value());
  EXPECT_THAT(snapshot->raw_content, ::testing::HasSubstr("Total files: 4\nIndexed: 3"));
}

TEST_F(ExternalIndexerTest, FolderFileRejectedByStoreIsRecordedAsFailed) {
  auto provider = std::make_shared<rag_tests::MockEmbeddingProvider>();
  ON_CALL(*provider, embed(_)).WillByDefault([](const std::string& text) {
    return std::vector<float>(text == "file b" ? kDimension + 1 : kDimension, 0.5f);
  });
  EXPECT_CALL(*provider, embed(_)).Times(3);
  ExternalIndexer indexer(store_, provider, repository_, std::make_shared<PlainTextExtractor>(), fetcher_,
                          data_dir_);
  const auto root = temp_dir_ / "mixed";
  TestUtilities::write_file(root / "a.txt", "file a");
  TestUtilities::write_file(root / "b.md", "file b");
  TestUtilities::write_file(root / "c.txt", "file c");

  auto result = indexer.index_folder(root.string(), "doc1", "fo");

  EXPECT_EQ(result.total_files, 3);
  EXPECT_EQ(result.success_count, 2);
  EXPECT_EQ(result.failed_files, std::vector<std::string>{"b.md"});
  EXPECT_EQ(store_->get_document_vectors("doc1").size(), 2u);
  auto snapshot = store_->get_external_content("doc1", "fo");
  ASSERT_TRUE(snapshot.has_value());
  EXPECT_THAT(snapshot->raw_content, ::testing::HasSubstr("Total files: 3\nIndexed: 2"));
}

TEST_F(ExternalIndexerTest, FolderDepthLimitsRecursion) {
  const auto root = temp_dir_ / "deep";
  TestUtilities::write_file(root / "top.txt", "top");
  TestUtilities::write_file(root / "l1" / "one.txt", "one");
  TestUtilities::write_file(root / "l1" / "l2" / "two.txt", "two");

  auto result = indexer_->index_folder(root.string(), "doc1", "fo", 1);

  EXPECT_EQ(result.total_files, 2);
}

TEST_F(ExternalIndexerTest, MissingFolderFails) {
  EXPECT_THROW(indexer_->index_folder((temp_dir_ / "nope").string(), "doc1", "fo"), ContentSourceError);
}

TEST_F(ExternalIndexerTest, ReindexAllVisitsEveryExternalBlock) {
  TestUtilities::write_file(data_dir_ / "files" / "a.txt", "attached");
  repository_->put("doc1", TestUtilities::document({
                               TestUtilities::block("bm", "bookmark", R"({"url": "https://x"})"),
                               TestUtilities::block("f1", "file", R"({"filePath": "/files/a.txt"})"),
                               TestUtilities::block("f2", "file", R"({"filePath": "/files/gone.txt"})"),
                               TestUtilities::block("empty", "bookmark", R"({"url": ""})"),
                           }));
  EXPECT_CALL(*fetcher_, fetch_content("https://x")).WillOnce(Return(WebContent{"X", "", "page"}));

  std::vector<int> seen;
  const int indexed = indexer_->reindex_all([&](int current, int total) {
    EXPECT_EQ(total, 3);
    // Reported once the unit has finished
    if (current == 1) {
      EXPECT_TRUE(store_->get_external_content("doc1", "bm").has_value());
    }
    seen.push_back(current);
  });

  EXPECT_EQ(indexed, 2);
  EXPECT_EQ(seen, (std::vector<int>{1, 2, 3}));
}

TEST_F(ExternalIndexerTest, SupportedExtensionsIgnoreCase) {
  EXPECT_TRUE(ExternalIndexer::is_supported_extension("report.PDF"));
  EXPECT_TRUE(ExternalIndexer::is_supported_extension("page.htm"));
  EXPECT_FALSE(ExternalIndexer::is_supported_extension("image.png"));
  EXPECT_FALSE(ExternalIndexer::is_supported_extension("Makefile"));
}

}  // namespace rag_core
