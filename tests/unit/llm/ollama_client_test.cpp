#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <nlohmann/json.hpp>

#include "../../common/mocks_test.hpp"
#include "rag_core/llm/ollama_client.hpp"

using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

namespace rag_core {

class OllamaClientTest : public ::testing::Test {
 protected:
  void SetUp() override {
    http_ = std::make_shared<rag_tests::MockHttpClient>();
    client_ = std::make_unique<OllamaClient>(http_, "http://localhost:11434", "nomic-embed-text");
  }

  static HttpResponse ok(const nlohmann::json& body) { return {200, body.dump()}; }

  std::shared_ptr<rag_tests::MockHttpClient> http_;
  std::unique_ptr<OllamaClient> client_;
};

TEST_F(OllamaClientTest, EmbedPostsModelAndPrompt) {
  HttpRequest captured;
  EXPECT_CALL(*http_, send(_)).WillOnce([&](const HttpRequest& request) {
    captured = request;
    return ok({{"embedding", {0.1, 0.2, 0.3}}});
  });

  auto vec = client_->embed("hello");

  ASSERT_EQ(vec.size(), 3u);
  EXPECT_FLOAT_EQ(vec[1], 0.2f);
  EXPECT_EQ(captured.method, "POST");
  EXPECT_EQ(captured.url, "http://localhost:11434/api/embeddings");
  auto body = nlohmann::json::parse(captured.body);
  EXPECT_EQ(body["model"], "nomic-embed-text");
  EXPECT_EQ(body["prompt"], "hello");
}

TEST_F(OllamaClientTest, TransportFailureHasStatusZero) {
  EXPECT_CALL(*http_, send(_)).WillOnce(Throw(HttpTransportError("connection refused")));

  try {
    client_->embed("hello");
    FAIL() << "Expected EmbeddingServiceError";
  } catch (const EmbeddingServiceError& e) {
    EXPECT_EQ(e.status_code(), 0);
    EXPECT_EQ(e.provider(), "ollama");
    EXPECT_FALSE(e.is_unrecoverable());
    EXPECT_THAT(e.what(), ::testing::HasSubstr("connection refused"));
  }
}

TEST_F(OllamaClientTest, ServerErrorIsUnrecoverable) {
  EXPECT_CALL(*http_, send(_)).WillOnce(Return(HttpResponse{500, "boom"}));

  try {
    client_->embed("hello");
    FAIL() << "Expected EmbeddingServiceError";
  } catch (const EmbeddingServiceError& e) {
    EXPECT_EQ(e.status_code(), 500);
    EXPECT_TRUE(e.is_unrecoverable());
    EXPECT_STREQ(e.what(), "ollama returned status 500");
  }
}

TEST_F(OllamaClientTest, MalformedBodyIsDecodeFailure) {
  EXPECT_CALL(*http_, send(_))
      .WillOnce(Return(HttpResponse{200, "<html>not ollama</html>"}))
      .WillOnce(Return(ok({{"embedding", nlohmann::json::array()}})));

  for (int i = 0; i < 2; ++i) {
    try {
      client_->embed("hello");
      FAIL() << "Expected EmbeddingServiceError";
    } catch (const EmbeddingServiceError& e) {
      EXPECT_EQ(e.status_code(), -1);
      EXPECT_TRUE(e.is_unrecoverable());
    }
  }
}

TEST_F(OllamaClientTest, EmbedBatchIssuesOneRequestPerText) {
  EXPECT_CALL(*http_, send(_)).Times(3).WillRepeatedly(Return(ok({{"embedding", {1.0, 0.0}}})));

  auto vectors = client_->embed_batch({"a", "b", "c"});
  EXPECT_EQ(vectors.size(), 3u);
}

TEST_F(OllamaClientTest, DetectDimensionRecordsVectorLength) {
  EXPECT_CALL(*http_, send(_)).WillOnce([](const HttpRequest& request) {
    EXPECT_EQ(nlohmann::json::parse(request.body)["prompt"], "test");
    return HttpResponse{200, nlohmann::json{{"embedding", std::vector<float>(768, 0.5f)}}.dump()};
  });

  EXPECT_EQ(client_->dimension(), 0);
  EXPECT_EQ(client_->detect_dimension(), 768);
  EXPECT_EQ(client_->dimension(), 768);
}

TEST_F(OllamaClientTest, ListModelsStripsLatestAndSorts) {
  nlohmann::json tags = {{"models",
                          {{{"name", "nomic-embed-text:latest"}},
                           {{"name", "all-minilm:33m"}},
                           {{"size", 12}}}}};
  EXPECT_CALL(*http_, send(_)).WillOnce([&](const HttpRequest& request) {
    EXPECT_EQ(request.url, "http://host:11434/api/tags");
    return ok(tags);
  });

  auto models = OllamaClient::list_models(*http_, "http://host:11434");
  EXPECT_EQ(models, (std::vector<std::string>{"all-minilm:33m", "nomic-embed-text"}));
}

TEST_F(OllamaClientTest, ListModelsReportsUnreachableServer) {
  EXPECT_CALL(*http_, send(_)).WillOnce(Throw(HttpTransportError("timeout")));
  EXPECT_THROW(OllamaClient::list_models(*http_, "http://host:11434"), std::runtime_error);
}

}  // namespace rag_core
