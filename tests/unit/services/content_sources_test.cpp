#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <string>

#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"
#include "rag_core/services/content_sources.hpp"
#include "rag_core/services/document_repository.hpp"

using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

namespace rag_core {

using rag_tests::TestUtilities;

TEST(StripHtmlTest, RemovesScriptsAndKeepsParagraphs) {
  const std::string html =
      "<div><script>var x = 1;</script><p>Hello&nbsp;<b>world</b></p><STYLE>p{}</STYLE><p>Second   line</p></div>";
  EXPECT_EQ(strip_html(html), "Hello world\n\nSecond line");
}

TEST(StripHtmlTest, DecodesEntities) {
  EXPECT_EQ(strip_html("a &lt;b&gt; &amp; &quot;c&quot;"), "a <b> & \"c\"");
}

class ContentSourcesTest : public ::testing::Test {
 protected:
  void SetUp() override { dir_ = TestUtilities::create_temp_dir("rag_sources"); }
  void TearDown() override { TestUtilities::cleanup_temp_dir(dir_); }

  std::filesystem::path dir_;
};

TEST_F(ContentSourcesTest, PlainTextExtractorReadsTextAndHtml) {
  PlainTextExtractor extractor;
  TestUtilities::write_file(dir_ / "a.txt", "plain text");
  TestUtilities::write_file(dir_ / "b.HTML", "<html><body><h1>Title</h1>body</body></html>");

  EXPECT_EQ(extractor.extract_text(dir_ / "a.txt"), "plain text");
  EXPECT_EQ(extractor.extract_text(dir_ / "b.HTML"), "Title\n\nbody");
  EXPECT_FALSE(extractor.can_handle(dir_ / "c.docx"));
  EXPECT_THROW(extractor.extract_text(dir_ / "c.docx"), ContentSourceError);
  EXPECT_THROW(extractor.extract_text(dir_ / "missing.txt"), ContentSourceError);
}

TEST_F(ContentSourcesTest, FetcherReadsTitleSiteNameAndBody) {
  auto http = std::make_shared<rag_tests::MockHttpClient>();
  EXPECT_CALL(*http, send(_))
      .WillOnce(Return(HttpResponse{200,
                                    "<html><head><title> A &amp; B </title>"
                                    "<meta property=\"og:site_name\" content=\"Site\"></head>"
                                    "<body><p>Body text</p></body></html>"}));
  CurlWebContentFetcher fetcher(http);

  WebContent page = fetcher.fetch_content("https://example.com");

  EXPECT_EQ(page.title, "A & B");
  EXPECT_EQ(page.site_name, "Site");
  EXPECT_EQ(page.text_content, "Body text");
}

TEST_F(ContentSourcesTest, FetcherTitleMatchingIgnoresCaseAndSimilarTags) {
  auto http = std::make_shared<rag_tests::MockHttpClient>();
  EXPECT_CALL(*http, send(_))
      .WillOnce(Return(HttpResponse{200,
                                    "<html><head><titlebar>no</titlebar><TITLE lang=\"en\">Upper</Title></head>"
                                    "<body><p>Body</p></body></html>"}))
      .WillOnce(Return(HttpResponse{200,
                                    "<html><head><title>Unclosed" + std::string(200000, 'x') +
                                        "</head><body><p>Body</p></body></html>"}));
  CurlWebContentFetcher fetcher(http);

  EXPECT_EQ(fetcher.fetch_content("https://example.com/a").title, "Upper");
  EXPECT_EQ(fetcher.fetch_content("https://example.com/b").title, "");
}

TEST_F(ContentSourcesTest, FetcherTurnsFailuresIntoContentErrors) {
  auto http = std::make_shared<rag_tests::MockHttpClient>();
  EXPECT_CALL(*http, send(_))
      .WillOnce(Return(HttpResponse{404, "missing"}))
      .WillOnce(Throw(HttpTransportError("dns failure")));
  CurlWebContentFetcher fetcher(http);

  EXPECT_THROW(fetcher.fetch_content("https://example.com/a"), ContentSourceError);
  EXPECT_THROW(fetcher.fetch_content("https://example.com/b"), ContentSourceError);
}

TEST_F(ContentSourcesTest, JsonRepositoryReadsIndexAndDocuments) {
  TestUtilities::write_file(dir_ / "index.json", R"({"documents": [
      {"id": "d1", "title": "First", "tags": ["a", 3, "b"]},
      {"title": "no id"},
      {"id": "d2"}]})");
  TestUtilities::write_file(dir_ / "documents" / "d1.json", "[{\"id\": \"p\"}]");
  JsonDocumentRepository repository(dir_);

  auto documents = repository.get_all();
  ASSERT_EQ(documents.size(), 2u);
  EXPECT_EQ(documents[0].title, "First");
  EXPECT_EQ(documents[0].tags, (std::vector<std::string>{"a", "b"}));
  EXPECT_EQ(repository.load("d1"), "[{\"id\": \"p\"}]");
  EXPECT_EQ(repository.load("d2"), "[]");
  EXPECT_THROW(repository.load("../etc"), DocumentRepositoryError);
}

TEST_F(ContentSourcesTest, JsonRepositoryWithoutIndexIsEmpty) {
  JsonDocumentRepository repository(dir_);
  EXPECT_TRUE(repository.get_all().empty());

  TestUtilities::write_file(dir_ / "index.json", "not json");
  EXPECT_THROW(repository.get_all(), DocumentRepositoryError);
}

}  // namespace rag_core
