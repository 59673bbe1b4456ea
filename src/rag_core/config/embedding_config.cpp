#include "rag_core/config/embedding_config.hpp"

#include <fstream>
#include <stdexcept>

namespace rag_core {

EmbeddingConfig EmbeddingConfig::from_json(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw std::runtime_error("Embedding config must be a JSON object");
  }
  EmbeddingConfig defaults;
  EmbeddingConfig config;
  try {
    config.provider = j.value("provider", defaults.provider);
    config.base_url = j.value("baseUrl", defaults.base_url);
    config.model = j.value("model", defaults.model);
    config.api_key = j.value("apiKey", std::string());
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(std::string("Invalid embedding config: ") + e.what());
  }
  return config;
}

nlohmann::json EmbeddingConfig::to_json() const {
  return {{"provider", provider}, {"baseUrl", base_url}, {"model", model}, {"apiKey", api_key}};
}

EmbeddingConfig EmbeddingConfig::load(const std::filesystem::path& data_dir) {
  const auto path = data_dir / kEmbeddingConfigFileName;
  std::ifstream file_stream(path);
  if (!file_stream.is_open()) {
    if (!std::filesystem::exists(path)) {
      return EmbeddingConfig{};
    }
    throw std::runtime_error("Failed to open embedding config: " + path.string());
  }

  nlohmann::json json_config;
  try {
    file_stream >> json_config;
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("Failed to parse JSON in embedding config '" + path.string() +
                             "': " + e.what());
  }
  return from_json(json_config);
}

void EmbeddingConfig::save(const std::filesystem::path& data_dir) const {
  std::filesystem::create_directories(data_dir);
  const auto path = data_dir / kEmbeddingConfigFileName;
  std::ofstream out(path, std::ios::trunc);
  if (!out.is_open()) {
    throw std::runtime_error("Failed to write embedding config: " + path.string());
  }
  out << to_json().dump(2);
}

}  // namespace rag_core
