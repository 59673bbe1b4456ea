#include "rag_core/services/search_service.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>
#include <regex>

#include "rag_core/chunking/block_parser.hpp"
#include "rag_core/types/block_vector.hpp"
#include "rag_core/utils/hash.hpp"

namespace rag_core {

namespace {

const std::regex kUuidPattern("[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}");

// Strips "_bookmark", "_file" or "_folder[_N]" from a composite external ID.
bool strip_external_suffix(std::string& id) {
  for (const std::string suffix : {"_bookmark", "_file", "_folder"}) {
    const auto pos = id.rfind(suffix);
    if (pos == std::string::npos) {
      continue;
    }
    const std::string rest = id.substr(pos + suffix.size());
    const bool folder_file = suffix == "_folder" && rest.size() > 1 && rest[0] == '_' &&
                             std::all_of(rest.begin() + 1, rest.end(), [](unsigned char c) { return std::isdigit(c); });
    if (rest.empty() || folder_file) {
      id.erase(pos);
      return true;
    }
  }
  return false;
}

}  // namespace

std::optional<std::string> resolve_source_block_id(const VectorSearchHit& hit) {
  if (!hit.source_block_id.empty()) {
    return hit.source_block_id;
  }
  if (is_aggregated_id(hit.id)) {
    return std::nullopt;
  }
  const auto pos = hit.id.find("_chunk_");
  std::string base = pos == std::string::npos ? hit.id : hit.id.substr(0, pos);

  // Rows written before source_block_id was stored: external IDs are
  // {docId}_{blockId}_<kind>, where the second UUID is the block.
  if (strip_external_suffix(base)) {
    std::vector<std::string> uuids;
    for (std::sregex_iterator it(base.begin(), base.end(), kUuidPattern), end; it != end; ++it) {
      uuids.push_back(it->str());
    }
    if (uuids.size() >= 2) {
      return uuids[1];
    }
    return std::nullopt;
  }
  if (std::regex_search(base, kUuidPattern)) {
    return base;
  }
  return std::nullopt;
}

ChunkMatch to_chunk_match(const VectorSearchHit& hit) {
  ChunkMatch match;
  match.block_id = hit.id;
  match.source_block_id = resolve_source_block_id(hit);
  const bool external = is_external_type(hit.block_type);
  match.source_type = external ? hit.block_type : "document";
  if (external) {
    match.source_title = hit.heading_context;
  }
  match.content = hit.content;
  match.block_type = hit.block_type;
  match.heading_context = hit.heading_context;
  match.score = std::clamp(1.0f - hit.distance, 0.0f, 1.0f);
  match.doc_id = hit.doc_id;
  return match;
}

SearchService::SearchService(std::shared_ptr<VectorStore> store,
                             std::shared_ptr<EmbeddingProvider> embedder,
                             std::shared_ptr<DocumentRepository> repository)
    : store_(std::move(store)), embedder_(std::move(embedder)), repository_(std::move(repository)) {}

std::vector<ChunkMatch> SearchService::nearest(const std::string& query, int k, const SearchFilter& filter) {
  const std::vector<float> query_embedding = embedder_->embed(query);
  const auto hits = store_->search(query_embedding, k, filter);

  std::vector<ChunkMatch> matches;
  matches.reserve(hits.size());
  for (const auto& hit : hits) {
    matches.push_back(to_chunk_match(hit));
  }
  return matches;
}

std::vector<ChunkMatch> SearchService::search_chunks(const std::string& query,
                                                     int limit,
                                                     const SearchFilter& filter) {
  if (limit <= 0) {
    return {};
  }
  return nearest(query, limit, filter);
}

std::vector<DocumentSearchResult> SearchService::search_documents(const std::string& query,
                                                                  int limit,
                                                                  const SearchFilter& filter) {
  if (limit <= 0) {
    return {};
  }
  const int fetch = std::max(limit * 5, 20);
  return with_titles(aggregate_by_document(nearest(query, fetch, filter), limit));
}

std::vector<DocumentSearchResult> SearchService::search_related(const std::string& doc_id, int limit) {
  if (limit <= 0) {
    return {};
  }
  const std::string query = extract_plain_text(repository_->load(doc_id), kRelatedQueryMaxChars);
  if (query.empty()) {
    return {};
  }

  SearchFilter filter;
  filter.exclude_doc_id = doc_id;
  const int fetch = std::max(limit * 8, 30);

  std::vector<ChunkMatch> matches = nearest(query, fetch, filter);
  matches.erase(std::remove_if(matches.begin(), matches.end(),
                               [&doc_id](const ChunkMatch& m) { return m.doc_id == doc_id; }),
                matches.end());
  return with_titles(aggregate_by_document(matches, limit));
}

std::vector<DocumentSearchResult> SearchService::aggregate_by_document(const std::vector<ChunkMatch>& matches,
                                                                       int limit) {
  if (limit <= 0) {
    return {};
  }

  std::map<std::string, size_t> position;
  std::vector<DocumentSearchResult> results;
  for (const auto& match : matches) {
    auto it = position.find(match.doc_id);
    if (it == position.end()) {
      it = position.emplace(match.doc_id, results.size()).first;
      DocumentSearchResult result;
      result.doc_id = match.doc_id;
      result.max_score = match.score;
      results.push_back(std::move(result));
    }
    DocumentSearchResult& result = results[it->second];
    result.max_score = std::max(result.max_score, match.score);
    result.matched_chunks.push_back(match);
  }

  auto by_score = [](const ChunkMatch& a, const ChunkMatch& b) { return a.score > b.score; };
  for (auto& result : results) {
    std::stable_sort(result.matched_chunks.begin(), result.matched_chunks.end(), by_score);
    if (result.matched_chunks.size() > static_cast<size_t>(kMaxChunksPerDocument)) {
      result.matched_chunks.resize(kMaxChunksPerDocument);
    }
  }

  std::stable_sort(results.begin(), results.end(),
                   [](const DocumentSearchResult& a, const DocumentSearchResult& b) {
                     return a.max_score > b.max_score;
                   });
  if (results.size() > static_cast<size_t>(limit)) {
    results.resize(static_cast<size_t>(limit));
  }
  return results;
}

std::vector<DocumentSearchResult> SearchService::with_titles(std::vector<DocumentSearchResult> results) {
  if (results.empty()) {
    return results;
  }
  std::map<std::string, std::string> titles;
  try {
    for (const auto& doc : repository_->get_all()) {
      titles[doc.id] = doc.title;
    }
  } catch (const DocumentRepositoryError& e) {
    std::cerr << "Warning: [Search] Could not load document titles: " << e.what() << std::endl;
  }
  for (auto& result : results) {
    auto it = titles.find(result.doc_id);
    if (it != titles.end()) {
      result.doc_title = it->second;
    }
  }
  return results;
}

}  // namespace rag_core
