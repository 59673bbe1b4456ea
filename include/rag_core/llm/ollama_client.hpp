#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "rag_core/llm/embedding_provider.hpp"
#include "rag_core/llm/http_client.hpp"

namespace rag_core {

// Local Ollama server. No native batching, so embed_batch issues one request per text.
class OllamaClient : public EmbeddingProvider {
 public:
  OllamaClient(std::shared_ptr<HttpClient> http, std::string base_url, std::string model);

  OllamaClient(const OllamaClient&) = delete;
  OllamaClient& operator=(const OllamaClient&) = delete;

  std::vector<float> embed(const std::string& text) override;
  std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) override;
  int dimension() const override { return detected_dim_.load(); }
  int detect_dimension() override;
  std::string name() const override { return "ollama"; }

  // Names from GET /api/tags with any ":latest" suffix removed, sorted.
  static std::vector<std::string> list_models(HttpClient& http, const std::string& base_url);

 private:
  std::shared_ptr<HttpClient> http_;
  std::string base_url_;
  std::string model_;
  std::atomic<int> detected_dim_{0};
};

}  // namespace rag_core
