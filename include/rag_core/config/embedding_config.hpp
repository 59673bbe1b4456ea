#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace rag_core {

inline constexpr const char* kEmbeddingConfigFileName = "rag_config.json";

// Which embedding service to call and how.
struct EmbeddingConfig {
  std::string provider = "ollama";
  std::string base_url = "http://localhost:11434";
  std::string model = "nomic-embed-text";
  std::string api_key;

  bool operator==(const EmbeddingConfig&) const = default;

  static EmbeddingConfig from_json(const nlohmann::json& j);
  nlohmann::json to_json() const;

  // Reads <data_dir>/rag_config.json. A missing file yields the defaults.
  static EmbeddingConfig load(const std::filesystem::path& data_dir);
  void save(const std::filesystem::path& data_dir) const;
};

}  // namespace rag_core
