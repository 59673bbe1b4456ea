#include "rag_core/llm/openai_client.hpp"

#include <algorithm>
#include <iterator>
#include <nlohmann/json.hpp>
#include <stdexcept>

#include "rag_core/utils/text_utils.hpp"

namespace rag_core {

namespace {

constexpr long kEmbedTimeoutSeconds = 30;
constexpr long kListTimeoutSeconds = 10;

std::string resolve_base_url(const std::string& base_url) {
  return base_url.empty() ? kOpenAIDefaultBaseUrl : base_url;
}

bool looks_like_embedding_model(const std::string& id) {
  const std::string lower = text::to_lower(id);
  for (const char* marker : {"embed", "bge", "e5", "gte"}) {
    if (lower.find(marker) != std::string::npos)
      return true;
  }
  return false;
}

}  // namespace

OpenAIClient::OpenAIClient(std::shared_ptr<HttpClient> http,
                           std::string base_url,
                           std::string model,
                           std::string api_key)
    : http_(std::move(http)),
      base_url_(resolve_base_url(base_url)),
      model_(std::move(model)),
      api_key_(std::move(api_key)) {}

std::vector<float> OpenAIClient::embed(const std::string& text) {
  auto embeddings = embed_batch({text});
  return std::move(embeddings.front());
}

std::vector<std::vector<float>> OpenAIClient::embed_batch(const std::vector<std::string>& texts) {
  if (texts.empty()) {
    return {};
  }

  HttpRequest request;
  request.method = "POST";
  request.url = base_url_ + "/embeddings";
  request.body = nlohmann::json{{"model", model_}, {"input", texts}}.dump();
  request.headers = {"Content-Type: application/json", "Authorization: Bearer " + api_key_};
  request.timeout_seconds = kEmbedTimeoutSeconds;

  HttpResponse response;
  try {
    response = http_->send(request);
  } catch (const HttpTransportError& e) {
    throw EmbeddingServiceError("openai", 0, std::string("openai request failed: ") + e.what());
  }

  if (response.status != 200) {
    throw EmbeddingServiceError("openai", static_cast<int>(response.status),
                                "openai returned status " + std::to_string(response.status));
  }

  auto body = nlohmann::json::parse(response.body, nullptr, false);
  if (body.is_discarded() || !body.is_object() || !body.contains("data") ||
      !body["data"].is_array() || body["data"].size() != texts.size()) {
    throw EmbeddingServiceError("openai", -1, "failed to decode openai embedding response");
  }

  std::vector<std::vector<float>> embeddings;
  embeddings.reserve(texts.size());
  try {
    for (const auto& item : body["data"]) {
      auto vec = item.at("embedding").get<std::vector<float>>();
      if (vec.empty()) {
        throw EmbeddingServiceError("openai", -1, "openai returned an empty embedding");
      }
      embeddings.push_back(std::move(vec));
    }
  } catch (const nlohmann::json::exception& e) {
    throw EmbeddingServiceError("openai", -1, std::string("failed to decode response: ") + e.what());
  }
  return embeddings;
}

int OpenAIClient::detect_dimension() {
  auto vec = embed("test");
  detected_dim_ = static_cast<int>(vec.size());
  return detected_dim_;
}

std::vector<std::string> OpenAIClient::list_models(HttpClient& http,
                                                   const std::string& base_url,
                                                   const std::string& api_key) {
  HttpRequest request;
  request.url = resolve_base_url(base_url) + "/models";
  request.headers = {"Authorization: Bearer " + api_key};
  request.timeout_seconds = kListTimeoutSeconds;

  HttpResponse response;
  try {
    response = http.send(request);
  } catch (const HttpTransportError& e) {
    throw std::runtime_error(std::string("failed to connect to OpenAI API: ") + e.what());
  }
  if (response.status == 401) {
    throw std::runtime_error("invalid API key");
  }
  if (response.status != 200) {
    throw std::runtime_error("API returned status " + std::to_string(response.status));
  }

  auto body = nlohmann::json::parse(response.body, nullptr, false);
  if (body.is_discarded() || !body.is_object()) {
    throw std::runtime_error("failed to parse API response");
  }

  std::vector<std::string> all_ids;
  for (const auto& m : body.value("data", nlohmann::json::array())) {
    if (m.is_object() && m.contains("id") && m["id"].is_string()) {
      all_ids.push_back(m["id"].get<std::string>());
    }
  }

  std::vector<std::string> models;
  std::copy_if(all_ids.begin(), all_ids.end(), std::back_inserter(models),
               looks_like_embedding_model);
  if (models.empty()) {
    models = std::move(all_ids);
  }
  std::sort(models.begin(), models.end());
  return models;
}

}  // namespace rag_core
