#pragma once

#include <exception>
#include <string>
#include <vector>

namespace rag_core {

/**
 * @class EmbeddingServiceError
 * @brief A failed embedding call, classified by the HTTP status it came with.
 *
 * status_code is the HTTP status, 0 when no response arrived (connection refused,
 * timeout) and -1 when the body could not be decoded into embeddings.
 */
class EmbeddingServiceError : public std::exception {
 public:
  EmbeddingServiceError(const std::string& provider, int status_code, const std::string& message)
      : provider_(provider), status_code_(status_code), message_(message) {}

  const char* what() const noexcept override { return message_.c_str(); }

  const std::string& provider() const { return provider_; }
  int status_code() const { return status_code_; }

  // 5xx, 401, 403, 404 and malformed responses will not go away by retrying.
  bool is_unrecoverable() const {
    return status_code_ >= 500 || status_code_ == 401 || status_code_ == 403 ||
           status_code_ == 404 || status_code_ == -1;
  }

 private:
  std::string provider_;
  int status_code_;
  std::string message_;
};

class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  virtual std::vector<float> embed(const std::string& text) = 0;
  virtual std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) = 0;

  // Dimension recorded by the last detect_dimension() call, 0 before that.
  virtual int dimension() const = 0;
  // Embeds a probe text and records the vector length.
  virtual int detect_dimension() = 0;

  virtual std::string name() const = 0;
};

}  // namespace rag_core
