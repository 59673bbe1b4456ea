#include "rag_core/llm/embedding_provider_factory.hpp"

#include <stdexcept>

#include "rag_core/llm/ollama_client.hpp"
#include "rag_core/llm/openai_client.hpp"

namespace rag_core {

std::unique_ptr<EmbeddingProvider> create_embedding_provider(const EmbeddingConfig& config,
                                                             std::shared_ptr<HttpClient> http) {
  if (config.provider == "ollama") {
    return std::make_unique<OllamaClient>(std::move(http), config.base_url, config.model);
  }
  if (config.provider == "openai") {
    return std::make_unique<OpenAIClient>(std::move(http), config.base_url, config.model,
                                          config.api_key);
  }
  throw std::invalid_argument("unknown provider: " + config.provider);
}

std::vector<std::string> list_models(HttpClient& http,
                                     const std::string& provider,
                                     const std::string& base_url,
                                     const std::string& api_key) {
  if (provider == "ollama") {
    return OllamaClient::list_models(http, base_url);
  }
  if (provider == "openai") {
    return OpenAIClient::list_models(http, base_url, api_key);
  }
  throw std::invalid_argument("unknown provider: " + provider);
}

ConnectionTestResult test_connection(const EmbeddingConfig& config, std::shared_ptr<HttpClient> http) {
  ConnectionTestResult result;
  try {
    auto provider = create_embedding_provider(config, std::move(http));
    result.dimension = provider->detect_dimension();
    result.success = true;
  } catch (const std::invalid_argument& e) {
    result.error = e.what();
  } catch (const EmbeddingServiceError& e) {
    result.error = e.what();
  }
  return result;
}

}  // namespace rag_core
