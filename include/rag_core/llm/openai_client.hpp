#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "rag_core/llm/embedding_provider.hpp"
#include "rag_core/llm/http_client.hpp"

namespace rag_core {

inline constexpr const char* kOpenAIDefaultBaseUrl = "https://api.openai.com/v1";

// OpenAI-compatible /embeddings endpoint with native batching and bearer auth.
class OpenAIClient : public EmbeddingProvider {
 public:
  OpenAIClient(std::shared_ptr<HttpClient> http,
               std::string base_url,
               std::string model,
               std::string api_key);

  OpenAIClient(const OpenAIClient&) = delete;
  OpenAIClient& operator=(const OpenAIClient&) = delete;

  std::vector<float> embed(const std::string& text) override;
  std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) override;
  int dimension() const override { return detected_dim_.load(); }
  int detect_dimension() override;
  std::string name() const override { return "openai"; }

  /**
   * @brief Model ids from GET /models, sorted.
   *
   * Only ids that look like embedding models (embed, bge, e5, gte) are returned
   * unless none match, in which case every id is returned.
   */
  static std::vector<std::string> list_models(HttpClient& http,
                                              const std::string& base_url,
                                              const std::string& api_key);

 private:
  std::shared_ptr<HttpClient> http_;
  std::string base_url_;
  std::string model_;
  std::string api_key_;
  std::atomic<int> detected_dim_{0};
};

}  // namespace rag_core
