#include "rag_core/services/document_repository.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace rag_core {

namespace {

std::string read_file(const std::filesystem::path& path) {
  std::ifstream file_stream(path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw DocumentRepositoryError("Could not open file: " + path.string());
  }
  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  return buffer.str();
}

}  // namespace

JsonDocumentRepository::JsonDocumentRepository(std::filesystem::path data_dir)
    : data_dir_(std::move(data_dir)) {}

std::vector<DocumentMeta> JsonDocumentRepository::get_all() {
  const auto index_path = data_dir_ / "index.json";
  if (!std::filesystem::exists(index_path)) {
    return {};
  }

  auto index = nlohmann::json::parse(read_file(index_path), nullptr, false);
  if (index.is_discarded() || !index.is_object()) {
    throw DocumentRepositoryError("Malformed document index: " + index_path.string());
  }

  std::vector<DocumentMeta> documents;
  auto docs = index.find("documents");
  if (docs == index.end() || !docs->is_array()) {
    return documents;
  }
  for (const auto& entry : *docs) {
    if (!entry.is_object())
      continue;
    DocumentMeta meta;
    meta.id = entry.value("id", std::string());
    meta.title = entry.value("title", std::string());
    auto tags = entry.find("tags");
    if (tags != entry.end() && tags->is_array()) {
      for (const auto& tag : *tags) {
        if (tag.is_string())
          meta.tags.push_back(tag.get<std::string>());
      }
    }
    if (!meta.id.empty()) {
      documents.push_back(std::move(meta));
    }
  }
  return documents;
}

std::string JsonDocumentRepository::load(const std::string& doc_id) {
  if (doc_id.empty() || doc_id.find('/') != std::string::npos || doc_id.find("..") != std::string::npos) {
    throw DocumentRepositoryError("Invalid document id: " + doc_id);
  }
  const auto path = data_dir_ / "documents" / (doc_id + ".json");
  if (!std::filesystem::exists(path)) {
    return "[]";
  }
  return read_file(path);
}

}  // namespace rag_core
