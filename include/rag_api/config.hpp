#pragma once

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "rag_core/types/chunk.hpp"

namespace rag_api {

class Config {
 public:
  std::string api_base_url;
  std::string data_directory;
  std::string db_file_name;
  int pool_size;

  // Chunking thresholds, in code points
  int max_chunk_size;
  int chunk_overlap;
  int short_block_threshold;
  int max_merged_length;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  static Config from_json(const nlohmann::json& json_config) {
    Config config;

    config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:3040"));
    config.data_directory = json_config.value("data_directory", std::string("./data"));
    config.db_file_name = json_config.value("db_file_name", std::string("rag.db"));

    config.pool_size = int_or(json_config, "pool_size", 4);
    config.max_chunk_size = int_or(json_config, "max_chunk_size", 800);
    config.chunk_overlap = int_or(json_config, "chunk_overlap", 100);
    config.short_block_threshold = int_or(json_config, "short_block_threshold", 150);
    config.max_merged_length = int_or(json_config, "max_merged_length", 600);

    config.validate();
    return config;
  }

  rag_core::ChunkConfig chunk_config() const {
    return {.max_chunk_size = max_chunk_size,
            .overlap = chunk_overlap,
            .short_block_threshold = short_block_threshold,
            .max_merged_length = max_merged_length};
  }

 private:
  // Wrong types fall back to the default
  static int int_or(const nlohmann::json& json_config, const char* key, int fallback) {
    auto it = json_config.find(key);
    if (it == json_config.end() || !it->is_number_integer()) {
      return fallback;
    }
    return it->get<int>();
  }

  void validate() const {
    if (api_base_url.empty() || api_base_url.find(':') == std::string::npos) {
      throw std::runtime_error("api_base_url must be of the form host:port");
    }
    if (data_directory.empty()) {
      throw std::runtime_error("data_directory cannot be empty");
    }
    if (db_file_name.empty()) {
      throw std::runtime_error("db_file_name cannot be empty");
    }
    if (pool_size <= 0) {
      throw std::runtime_error("pool_size must be greater than 0");
    }
    if (max_chunk_size < 0 || chunk_overlap < 0 || short_block_threshold < 0 || max_merged_length < 0) {
      throw std::runtime_error("chunk thresholds cannot be negative");
    }
    if (max_chunk_size > 0 && chunk_overlap >= max_chunk_size) {
      throw std::runtime_error("chunk_overlap must be smaller than max_chunk_size");
    }
  }
};

}  // namespace rag_api
