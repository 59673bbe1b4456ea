#include "rag_core/llm/ollama_client.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace rag_core {

namespace {
constexpr long kEmbedTimeoutSeconds = 30;
constexpr long kListTimeoutSeconds = 10;
}  // namespace

OllamaClient::OllamaClient(std::shared_ptr<HttpClient> http, std::string base_url, std::string model)
    : http_(std::move(http)), base_url_(std::move(base_url)), model_(std::move(model)) {}

std::vector<float> OllamaClient::embed(const std::string& text) {
  HttpRequest request;
  request.method = "POST";
  request.url = base_url_ + "/api/embeddings";
  request.body = nlohmann::json{{"model", model_}, {"prompt", text}}.dump();
  request.headers = {"Content-Type: application/json"};
  request.timeout_seconds = kEmbedTimeoutSeconds;

  HttpResponse response;
  try {
    response = http_->send(request);
  } catch (const HttpTransportError& e) {
    throw EmbeddingServiceError("ollama", 0, std::string("ollama request failed: ") + e.what());
  }

  if (response.status != 200) {
    throw EmbeddingServiceError("ollama", static_cast<int>(response.status),
                                "ollama returned status " + std::to_string(response.status));
  }

  // A 200 with an unexpected body usually means the URL points at something other than Ollama
  auto body = nlohmann::json::parse(response.body, nullptr, false);
  if (body.is_discarded() || !body.is_object() || !body.contains("embedding") ||
      !body["embedding"].is_array() || body["embedding"].empty()) {
    throw EmbeddingServiceError("ollama", -1, "failed to decode ollama embedding response");
  }
  try {
    return body["embedding"].get<std::vector<float>>();
  } catch (const nlohmann::json::exception& e) {
    throw EmbeddingServiceError("ollama", -1, std::string("failed to decode response: ") + e.what());
  }
}

std::vector<std::vector<float>> OllamaClient::embed_batch(const std::vector<std::string>& texts) {
  std::vector<std::vector<float>> results;
  results.reserve(texts.size());
  for (const auto& text : texts) {
    results.push_back(embed(text));
  }
  return results;
}

int OllamaClient::detect_dimension() {
  auto vec = embed("test");
  detected_dim_ = static_cast<int>(vec.size());
  return detected_dim_;
}

std::vector<std::string> OllamaClient::list_models(HttpClient& http, const std::string& base_url) {
  HttpRequest request;
  request.url = base_url + "/api/tags";
  request.timeout_seconds = kListTimeoutSeconds;

  HttpResponse response;
  try {
    response = http.send(request);
  } catch (const HttpTransportError& e) {
    throw std::runtime_error(std::string("failed to connect to Ollama: ") + e.what());
  }
  if (response.status != 200) {
    throw std::runtime_error("Ollama returned status " + std::to_string(response.status));
  }

  auto body = nlohmann::json::parse(response.body, nullptr, false);
  if (body.is_discarded() || !body.is_object()) {
    throw std::runtime_error("failed to parse Ollama response");
  }

  std::vector<std::string> models;
  for (const auto& m : body.value("models", nlohmann::json::array())) {
    if (!m.is_object() || !m.contains("name") || !m["name"].is_string())
      continue;
    std::string name = m["name"].get<std::string>();
    const std::string suffix = ":latest";
    if (name.ends_with(suffix)) {
      name.erase(name.size() - suffix.size());
    }
    models.push_back(std::move(name));
  }
  std::sort(models.begin(), models.end());
  return models;
}

}  // namespace rag_core
