#pragma once

#include <memory>
#include <string>
#include <vector>

namespace rag_core {

// Connection refused, DNS failure, timeout. Carries no HTTP status.
class HttpTransportError : public std::exception {
 public:
  explicit HttpTransportError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override { return message_.c_str(); }

 private:
  std::string message_;
};

struct HttpRequest {
  std::string method = "GET";
  std::string url;
  std::string body;
  std::vector<std::string> headers;
  long timeout_seconds = 30;
};

struct HttpResponse {
  long status = 0;
  std::string body;
};

class HttpClient {
 public:
  virtual ~HttpClient() = default;

  // Returns any HTTP status; throws HttpTransportError when no response arrived.
  virtual HttpResponse send(const HttpRequest& request) = 0;
};

// A fresh easy handle per request so one client can be shared between threads.
class CurlHttpClient : public HttpClient {
 public:
  HttpResponse send(const HttpRequest& request) override;

 private:
  static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp);
};

}  // namespace rag_core
