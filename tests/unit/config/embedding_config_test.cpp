#include <gtest/gtest.h>

#include <fstream>

#include "../../common/utilities_test.hpp"
#include "rag_core/config/embedding_config.hpp"

namespace rag_core {

class EmbeddingConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { dir_ = rag_tests::TestUtilities::create_temp_dir("rag_config"); }
  void TearDown() override { rag_tests::TestUtilities::cleanup_temp_dir(dir_); }

  std::filesystem::path dir_;
};

TEST_F(EmbeddingConfigTest, MissingFileYieldsDefaults) {
  auto config = EmbeddingConfig::load(dir_);
  EXPECT_EQ(config, EmbeddingConfig{});
  EXPECT_EQ(config.provider, "ollama");
  EXPECT_EQ(config.base_url, "http://localhost:11434");
  EXPECT_EQ(config.model, "nomic-embed-text");
}

TEST_F(EmbeddingConfigTest, SaveThenLoadPreservesFields) {
  EmbeddingConfig config;
  config.provider = "openai";
  config.base_url = "https://api.example.com/v1";
  config.model = "text-embedding-3-small";
  config.api_key = "sk-123";
  config.save(dir_ / "nested");

  EXPECT_TRUE(std::filesystem::exists(dir_ / "nested" / kEmbeddingConfigFileName));
  EXPECT_EQ(EmbeddingConfig::load(dir_ / "nested"), config);
}

TEST_F(EmbeddingConfigTest, UsesCamelCaseKeys) {
  EmbeddingConfig config;
  config.api_key = "secret";
  auto j = config.to_json();
  EXPECT_TRUE(j.contains("baseUrl"));
  EXPECT_EQ(j["apiKey"], "secret");
}

TEST_F(EmbeddingConfigTest, PartialJsonKeepsDefaultsForMissingKeys) {
  auto config = EmbeddingConfig::from_json({{"model", "mxbai-embed-large"}});
  EXPECT_EQ(config.provider, "ollama");
  EXPECT_EQ(config.model, "mxbai-embed-large");
  EXPECT_TRUE(config.api_key.empty());
}

TEST_F(EmbeddingConfigTest, RejectsMalformedConfig) {
  EXPECT_THROW(EmbeddingConfig::from_json(nlohmann::json::array()), std::runtime_error);
  EXPECT_THROW(EmbeddingConfig::from_json({{"provider", 5}}), std::runtime_error);

  rag_tests::TestUtilities::write_file(dir_ / kEmbeddingConfigFileName, "{ not json");
  EXPECT_THROW(EmbeddingConfig::load(dir_), std::runtime_error);
}

}  // namespace rag_core
