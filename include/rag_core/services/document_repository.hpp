#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace rag_core {

class DocumentRepositoryError : public std::exception {
 public:
  explicit DocumentRepositoryError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override { return message_.c_str(); }

 private:
  std::string message_;
};

struct DocumentMeta {
  std::string id;
  std::string title;
  std::vector<std::string> tags;
};

// Read-only view of the note store.
class DocumentRepository {
 public:
  virtual ~DocumentRepository() = default;

  virtual std::vector<DocumentMeta> get_all() = 0;
  // Serialized block tree of the document.
  virtual std::string load(const std::string& doc_id) = 0;
};

/**
 * @class JsonDocumentRepository
 * @brief The application's on-disk layout: <data>/index.json and <data>/documents/<id>.json.
 *
 * index.json is {"documents": [{"id", "title", "tags"}]}. A missing index means
 * no documents; a missing document file reads as an empty block list.
 */
class JsonDocumentRepository : public DocumentRepository {
 public:
  explicit JsonDocumentRepository(std::filesystem::path data_dir);

  std::vector<DocumentMeta> get_all() override;
  std::string load(const std::string& doc_id) override;

 private:
  std::filesystem::path data_dir_;
};

}  // namespace rag_core
