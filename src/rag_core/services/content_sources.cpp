#include "rag_core/services/content_sources.hpp"

#include <cctype>
#include <fstream>
#include <regex>
#include <set>
#include <sstream>
#include <vector>

#include "rag_core/utils/text_utils.hpp"

namespace rag_core {

namespace {

constexpr long kFetchTimeoutSeconds = 20;

std::string lower_extension(const std::filesystem::path& path) {
  return text::to_lower(path.extension().string());
}

std::string decode_entities(std::string s) {
  static const std::pair<const char*, const char*> kEntities[] = {
      {"&nbsp;", " "}, {"&lt;", "<"}, {"&gt;", ">"}, {"&quot;", "\""}, {"&#39;", "'"}, {"&amp;", "&"}};
  for (const auto& [entity, replacement] : kEntities) {
    size_t pos = 0;
    const std::string needle(entity);
    while ((pos = s.find(needle, pos)) != std::string::npos) {
      s.replace(pos, needle.size(), replacement);
      pos += std::string_view(replacement).size();
    }
  }
  return s;
}

std::string first_match(const std::string& html, const std::regex& pattern) {
  std::smatch match;
  if (std::regex_search(html, match, pattern) && match.size() > 1) {
    return text::trim(decode_entities(match[1].str()));
  }
  return "";
}

// Text between the first <title ...> and its closing tag, empty when either is missing.
std::string extract_title(const std::string& html) {
  const std::string lower = text::to_lower(html);
  size_t open = 0;
  while ((open = lower.find("<title", open)) != std::string::npos) {
    const size_t after = open + 6;
    if (after < lower.size() && (lower[after] == '>' || std::isspace(static_cast<unsigned char>(lower[after])))) {
      break;
    }
    open = after;
  }
  if (open == std::string::npos) {
    return "";
  }
  const size_t start = lower.find('>', open);
  if (start == std::string::npos) {
    return "";
  }
  const size_t end = lower.find("</title>", start + 1);
  if (end == std::string::npos) {
    return "";
  }
  return text::trim(decode_entities(html.substr(start + 1, end - start - 1)));
}

}  // namespace

std::string strip_html(std::string_view html) {
  static const std::set<std::string> kBlockTags = {"p",  "div", "br", "li", "tr", "h1", "h2", "h3",
                                                   "h4", "h5",  "h6", "section", "article"};
  std::string lower = text::to_lower(html);
  std::string out;
  out.reserve(html.size());

  size_t i = 0;
  while (i < html.size()) {
    if (html[i] != '<') {
      out += html[i++];
      continue;
    }
    const size_t close = html.find('>', i);
    if (close == std::string_view::npos) {
      break;
    }

    size_t name_start = i + 1;
    const bool closing = name_start < close && html[name_start] == '/';
    if (closing)
      ++name_start;
    size_t name_end = name_start;
    while (name_end < close && std::isalnum(static_cast<unsigned char>(html[name_end])))
      ++name_end;
    const std::string name = lower.substr(name_start, name_end - name_start);

    if (!closing && (name == "script" || name == "style")) {
      const size_t end_tag = lower.find("</" + name, close);
      if (end_tag == std::string::npos) {
        break;
      }
      i = lower.find('>', end_tag);
      i = (i == std::string::npos) ? html.size() : i + 1;
      continue;
    }
    if (kBlockTags.count(name) && (closing || name == "br")) {
      out += "\n\n";
    }
    i = close + 1;
  }

  out = decode_entities(out);

  // Collapse horizontal whitespace and keep at most one blank line between paragraphs
  std::vector<std::string> paragraphs;
  for (const auto& block : text::split(out, "\n")) {
    std::string line;
    bool in_space = false;
    for (char c : block) {
      if (c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v') {
        in_space = true;
        continue;
      }
      if (in_space && !line.empty())
        line += ' ';
      in_space = false;
      line += c;
    }
    paragraphs.push_back(std::move(line));
  }

  std::string result;
  bool pending_break = false;
  for (const auto& line : paragraphs) {
    if (line.empty()) {
      pending_break = !result.empty();
      continue;
    }
    if (!result.empty())
      result += pending_break ? "\n\n" : "\n";
    result += line;
    pending_break = false;
  }
  return result;
}

bool PlainTextExtractor::can_handle(const std::filesystem::path& file_path) const {
  const std::string ext = lower_extension(file_path);
  return ext == ".txt" || ext == ".md" || ext == ".html" || ext == ".htm";
}

std::string PlainTextExtractor::extract_text(const std::filesystem::path& file_path) const {
  if (!can_handle(file_path)) {
    throw ContentSourceError("Unsupported file type: " + file_path.string());
  }
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw ContentSourceError("Could not open file: " + file_path.string());
  }
  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  std::string content = text::sanitize_utf8(buffer.str());

  const std::string ext = lower_extension(file_path);
  if (ext == ".html" || ext == ".htm") {
    return strip_html(content);
  }
  return content;
}

CurlWebContentFetcher::CurlWebContentFetcher(std::shared_ptr<HttpClient> http)
    : http_(std::move(http)) {}

WebContent CurlWebContentFetcher::fetch_content(const std::string& url) {
  static const std::regex site_name_pattern(
      R"(<meta[^>]+property\s*=\s*["']og:site_name["'][^>]*content\s*=\s*["']([^"']*)["'])",
      std::regex_constants::icase);

  HttpRequest request;
  request.url = url;
  request.headers = {"Accept: text/html"};
  request.timeout_seconds = kFetchTimeoutSeconds;

  HttpResponse response;
  try {
    response = http_->send(request);
  } catch (const HttpTransportError& e) {
    throw ContentSourceError(std::string("Failed to fetch ") + url + ": " + e.what());
  }
  if (response.status != 200) {
    throw ContentSourceError("Failed to fetch " + url + ": status " + std::to_string(response.status));
  }

  const std::string html = text::sanitize_utf8(response.body);
  WebContent content;
  content.title = extract_title(html);
  content.site_name = first_match(html, site_name_pattern);

  // Skip the <head> so the title and meta text do not leak into the body text
  const std::string lower = text::to_lower(html);
  size_t body_start = lower.find("<body");
  if (body_start == std::string::npos) {
    body_start = 0;
  }
  content.text_content = strip_html(std::string_view(html).substr(body_start));
  return content;
}

}  // namespace rag_core
