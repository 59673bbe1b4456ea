#include <gtest/gtest.h>

#include "rag_core/chunking/block_parser.hpp"
#include "../../common/utilities_test.hpp"

using rag_core::BlockKind;
using rag_tests::TestUtilities;

TEST(BlockParserTest, RejectsNonArrayContent) {
  EXPECT_FALSE(rag_core::parse_blocks("").has_value());
  EXPECT_FALSE(rag_core::parse_blocks("{\"id\":\"x\"}").has_value());
  EXPECT_FALSE(rag_core::parse_blocks("[not json").has_value());
}

TEST(BlockParserTest, DecodesInlineTextAndLinks) {
  const std::string content = R"([{
    "id": "p1", "type": "paragraph",
    "content": [
      {"type": "text", "text": "  See "},
      {"type": "link", "href": "https://x", "content": [{"type": "text", "text": "the docs"}]},
      {"type": "text", "text": " now  "}
    ]
  }])";
  auto blocks = rag_core::parse_blocks(content);
  ASSERT_TRUE(blocks.has_value());
  ASSERT_EQ(blocks->size(), 1u);
  EXPECT_EQ(blocks->at(0).text, "See the docs now");
  EXPECT_EQ(blocks->at(0).kind, BlockKind::Other);
}

TEST(BlockParserTest, MissingFieldsFallBackToDefaults) {
  auto blocks = rag_core::parse_blocks(R"([{"type": 5}, {"id": "h", "type": "heading", "children": [{"id": "c"}]}])");
  ASSERT_TRUE(blocks.has_value());
  ASSERT_EQ(blocks->size(), 2u);
  EXPECT_EQ(blocks->at(0).id, "");
  EXPECT_EQ(blocks->at(0).type, "");
  EXPECT_EQ(blocks->at(1).kind, BlockKind::Heading);
  ASSERT_EQ(blocks->at(1).children.size(), 1u);
  EXPECT_EQ(blocks->at(1).children[0].id, "c");
}

TEST(BlockParserTest, CollectsExternalRefsInDocumentOrder) {
  const std::string content = TestUtilities::document({
      TestUtilities::block("bm", "bookmark", R"({"url": "https://example.com"})"),
      R"({"id": "wrap", "type": "paragraph", "children": [
           {"id": "f1", "type": "file", "props": {"filePath": "/files/a.txt", "fileName": "a.txt"}}]})",
      TestUtilities::block("fo", "folder", R"({"folderPath": "/home/me/notes"})"),
  });

  const auto refs = rag_core::extract_external_refs(content);
  ASSERT_EQ(refs.bookmarks.size(), 1u);
  EXPECT_EQ(refs.bookmarks[0].url, "https://example.com");
  ASSERT_EQ(refs.files.size(), 1u);
  EXPECT_EQ(refs.files[0].block_id, "f1");
  EXPECT_EQ(refs.files[0].file_name, "a.txt");
  ASSERT_EQ(refs.folders.size(), 1u);
  EXPECT_EQ(refs.folders[0].folder_name, "notes");
  EXPECT_EQ(refs.folder_block_ids(), std::vector<std::string>{"fo"});
}

TEST(BlockParserTest, PlainTextIsJoinedAndCapped) {
  const std::string content = TestUtilities::document({
      TestUtilities::heading("h", "Title"),
      TestUtilities::paragraph("p", "body text"),
  });
  EXPECT_EQ(rag_core::extract_plain_text(content, 500), "Title body text");
  EXPECT_EQ(rag_core::extract_plain_text(content, 7), "Title b");
  EXPECT_EQ(rag_core::extract_plain_text("garbage", 500), "");
}
