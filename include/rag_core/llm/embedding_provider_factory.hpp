#pragma once

#include <memory>
#include <string>
#include <vector>

#include "rag_core/config/embedding_config.hpp"
#include "rag_core/llm/embedding_provider.hpp"
#include "rag_core/llm/http_client.hpp"

namespace rag_core {

struct ConnectionTestResult {
  bool success = false;
  int dimension = 0;
  std::string error;
};

// Throws std::invalid_argument for an unknown provider.
std::unique_ptr<EmbeddingProvider> create_embedding_provider(const EmbeddingConfig& config,
                                                             std::shared_ptr<HttpClient> http);

std::vector<std::string> list_models(HttpClient& http,
                                     const std::string& provider,
                                     const std::string& base_url,
                                     const std::string& api_key);

// Creates a provider and probes its dimension. Never throws for provider failures.
ConnectionTestResult test_connection(const EmbeddingConfig& config, std::shared_ptr<HttpClient> http);

}  // namespace rag_core
