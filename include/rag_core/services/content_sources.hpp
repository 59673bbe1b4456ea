#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include "rag_core/llm/http_client.hpp"

namespace rag_core {

class ContentSourceError : public std::exception {
 public:
  explicit ContentSourceError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override { return message_.c_str(); }

 private:
  std::string message_;
};

// Text of a file attached to a note.
class TextExtractor {
 public:
  virtual ~TextExtractor() = default;

  virtual bool can_handle(const std::filesystem::path& file_path) const = 0;
  // Throws ContentSourceError when the file cannot be read or is not supported.
  virtual std::string extract_text(const std::filesystem::path& file_path) const = 0;
};

// .txt and .md verbatim, .html/.htm with markup removed.
class PlainTextExtractor : public TextExtractor {
 public:
  bool can_handle(const std::filesystem::path& file_path) const override;
  std::string extract_text(const std::filesystem::path& file_path) const override;
};

struct WebContent {
  std::string title;
  std::string site_name;
  std::string text_content;
};

class WebContentFetcher {
 public:
  virtual ~WebContentFetcher() = default;

  virtual WebContent fetch_content(const std::string& url) = 0;
};

// GETs the page and reads <title>, og:site_name and the tag-stripped body.
class CurlWebContentFetcher : public WebContentFetcher {
 public:
  explicit CurlWebContentFetcher(std::shared_ptr<HttpClient> http);

  WebContent fetch_content(const std::string& url) override;

 private:
  std::shared_ptr<HttpClient> http_;
};

// Drops script/style, turns block-level tags into paragraph breaks and decodes basic entities.
std::string strip_html(std::string_view html);

}  // namespace rag_core
