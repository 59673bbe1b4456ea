#include "rag_core/services/external_indexer.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <system_error>

#include "rag_core/chunking/block_parser.hpp"
#include "rag_core/chunking/text_chunker.hpp"
#include "rag_core/utils/hash.hpp"
#include "rag_core/utils/text_utils.hpp"

namespace rag_core {

namespace fs = std::filesystem;

namespace {

const std::set<std::string> kSupportedExtensions = {".pdf", ".docx", ".xlsx", ".epub",
                                                     ".html", ".htm", ".txt", ".md"};
const std::set<std::string> kSkippedDirectories = {"node_modules", "vendor", "__pycache__"};

int64_t now_seconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string snapshot_id(const std::string& doc_id, const std::string& block_id) {
  return doc_id + "_" + block_id;
}

}  // namespace

ExternalIndexer::ExternalIndexer(std::shared_ptr<VectorStore> store,
                                 std::shared_ptr<EmbeddingProvider> embedder,
                                 std::shared_ptr<DocumentRepository> repository,
                                 std::shared_ptr<TextExtractor> extractor,
                                 std::shared_ptr<WebContentFetcher> fetcher,
                                 fs::path data_dir,
                                 ChunkConfig config)
    : store_(std::move(store)),
      embedder_(std::move(embedder)),
      repository_(std::move(repository)),
      extractor_(std::move(extractor)),
      fetcher_(std::move(fetcher)),
      data_dir_(std::move(data_dir)),
      config_(config) {
  const char* debug = std::getenv("RAG_DEBUG_CHUNKS");
  debug_chunks_ = debug != nullptr && std::string(debug) == "1";
}

void ExternalIndexer::set_chunk_config(const ChunkConfig& config) {
  std::lock_guard<std::mutex> lock(config_mutex_);
  config_ = config;
}

bool ExternalIndexer::is_supported_extension(const fs::path& path) {
  return kSupportedExtensions.count(text::to_lower(path.extension().string())) > 0;
}

fs::path ExternalIndexer::resolve_path(const std::string& path) const {
  fs::path candidate(path);
  std::error_code ec;
  if (candidate.is_absolute() && fs::exists(candidate, ec)) {
    return candidate;
  }
  std::string relative = path;
  while (!relative.empty() && relative.front() == '/') {
    relative.erase(0, 1);
  }
  return data_dir_ / relative;
}

ExtractedBlocks ExternalIndexer::chunk(const std::string& text,
                                       const std::string& heading_context,
                                       const std::string& base_id,
                                       const std::string& block_type) const {
  ChunkConfig config;
  {
    std::lock_guard<std::mutex> lock(config_mutex_);
    config = config_;
  }
  ExtractedBlocks chunks = chunk_text_content(text, heading_context, base_id, block_type, config);
  if (chunks.empty()) {
    chunks.push_back({.id = base_id,
                      .source_block_id = "",
                      .type = block_type,
                      .content = text::trim(text::sanitize_utf8(text)),
                      .heading_context = heading_context});
  }
  return chunks;
}

ExternalIndexer::StoreOutcome ExternalIndexer::store_chunks(const ExtractedBlocks& chunks,
                                                            const std::string& doc_id,
                                                            const std::string& block_id,
                                                            const std::string& block_type,
                                                            const std::string& file_path) {
  StoreOutcome outcome;
  for (const auto& chunk : chunks) {
    if (chunk.content.empty()) {
      continue;
    }
    std::vector<float> embedding;
    try {
      embedding = embedder_->embed(chunk.content);
    } catch (const EmbeddingServiceError& e) {
      std::cerr << "Warning: [ExternalIndexer] Failed to embed chunk " << chunk.id << ": " << e.what()
                << std::endl;
      ++outcome.failed;
      outcome.last_error = std::current_exception();
      continue;
    }

    BlockVector row;
    row.id = chunk.id;
    row.source_block_id = block_id;
    row.doc_id = doc_id;
    row.content = chunk.content;
    row.content_hash = hash_content(chunk.content + chunk.heading_context);
    row.block_type = block_type;
    row.heading_context = chunk.heading_context;
    row.file_path = file_path;
    row.embedding = std::move(embedding);
    try {
      store_->upsert(row);
    } catch (const VectorStoreError& e) {
      std::cerr << "Warning: [ExternalIndexer] Failed to store chunk " << chunk.id << ": " << e.what()
                << std::endl;
      ++outcome.failed;
      outcome.last_error = std::current_exception();
      continue;
    }
    ++outcome.stored;
  }
  return outcome;
}

int ExternalIndexer::index_bookmark(const std::string& url,
                                    const std::string& doc_id,
                                    const std::string& block_id) {
  WebContent page = fetcher_->fetch_content(url);
  if (text::trim(page.text_content).empty()) {
    throw ContentSourceError("no content extracted from " + url);
  }

  std::string heading = page.title;
  if (!page.site_name.empty() && !page.title.empty()) {
    heading = page.title + " - " + page.site_name;
  } else if (heading.empty()) {
    heading = page.site_name;
  }

  const std::string base_id = doc_id + "_" + block_id + "_bookmark";
  store_->delete_by_prefix(base_id);

  ExternalBlockContent snapshot;
  snapshot.id = snapshot_id(doc_id, block_id);
  snapshot.doc_id = doc_id;
  snapshot.block_id = block_id;
  snapshot.block_type = kBookmarkType;
  snapshot.url = url;
  snapshot.title = page.title;
  snapshot.raw_content = page.text_content;
  snapshot.extracted_at = now_seconds();
  store_->save_external_content(snapshot);

  const ExtractedBlocks chunks = chunk(page.text_content, heading, base_id, kBookmarkType);
  debug_dump("Bookmark " + url, chunks);

  StoreOutcome outcome = store_chunks(chunks, doc_id, block_id, kBookmarkType, "");
  if (outcome.stored == 0 && outcome.last_error) {
    std::rethrow_exception(outcome.last_error);
  }
  std::cout << "[ExternalIndexer] Indexed bookmark " << url << " (" << outcome.stored << " chunks)"
            << std::endl;
  return outcome.stored;
}

int ExternalIndexer::index_file(const std::string& file_path,
                                const std::string& doc_id,
                                const std::string& block_id,
                                const std::string& file_name) {
  const fs::path path = resolve_path(file_path);
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    throw ContentSourceError("file not found: " + path.string());
  }

  const std::string content = extractor_->extract_text(path);
  if (text::trim(content).empty()) {
    throw ContentSourceError("no text extracted from " + path.string());
  }

  const std::string heading = file_name.empty() ? path.filename().string() : file_name;
  const std::string base_id = doc_id + "_" + block_id + "_file";
  store_->delete_by_prefix(base_id);

  ExternalBlockContent snapshot;
  snapshot.id = snapshot_id(doc_id, block_id);
  snapshot.doc_id = doc_id;
  snapshot.block_id = block_id;
  snapshot.block_type = kFileType;
  snapshot.file_path = file_path;
  snapshot.title = heading;
  snapshot.raw_content = content;
  snapshot.extracted_at = now_seconds();
  store_->save_external_content(snapshot);

  const ExtractedBlocks chunks = chunk(content, heading, base_id, kFileType);
  debug_dump("File " + path.string(), chunks);

  StoreOutcome outcome = store_chunks(chunks, doc_id, block_id, kFileType, file_path);
  if (outcome.stored == 0 && outcome.last_error) {
    std::rethrow_exception(outcome.last_error);
  }
  std::cout << "[ExternalIndexer] Indexed file " << heading << " (" << outcome.stored << " chunks)"
            << std::endl;
  return outcome.stored;
}

void ExternalIndexer::walk_folder(const fs::path& dir,
                                  int depth,
                                  int max_depth,
                                  std::vector<fs::path>& files) const {
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    if (depth == 0) {
      throw ContentSourceError("cannot read folder " + dir.string() + ": " + ec.message());
    }
    std::cerr << "Warning: [ExternalIndexer] Skipping unreadable folder " << dir << ": " << ec.message()
              << std::endl;
    return;
  }

  std::vector<fs::directory_entry> entries;
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) {
      std::cerr << "Warning: [ExternalIndexer] Error while listing " << dir << ": " << ec.message()
                << std::endl;
      break;
    }
    entries.push_back(*it);
  }
  std::sort(entries.begin(), entries.end(), [](const fs::directory_entry& a, const fs::directory_entry& b) {
    return a.path().filename() < b.path().filename();
  });

  for (const auto& entry : entries) {
    const std::string name = entry.path().filename().string();
    std::error_code status_ec;
    if (entry.is_directory(status_ec)) {
      if (name.starts_with(".") || kSkippedDirectories.count(name)) {
        continue;
      }
      if (depth < max_depth) {
        walk_folder(entry.path(), depth + 1, max_depth, files);
      }
    } else if (entry.is_regular_file(status_ec) && is_supported_extension(entry.path())) {
      files.push_back(entry.path());
    }
  }
}

FolderIndexResult ExternalIndexer::index_folder(const std::string& folder_path,
                                                const std::string& doc_id,
                                                const std::string& block_id,
                                                int max_depth) {
  if (max_depth <= 0) {
    max_depth = kDefaultFolderDepth;
  }
  const fs::path root = resolve_path(folder_path);
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    throw ContentSourceError("folder not found: " + root.string());
  }

  std::vector<fs::path> files;
  walk_folder(root, 0, max_depth, files);

  const std::string folder_name = root.filename().empty() ? root.parent_path().filename().string()
                                                          : root.filename().string();
  const std::string base_id = doc_id + "_" + block_id + "_folder";
  store_->delete_by_prefix(base_id);

  FolderIndexResult result;
  result.total_files = static_cast<int>(files.size());

  for (size_t i = 0; i < files.size(); ++i) {
    const fs::path& file = files[i];
    const std::string file_name = file.filename().string();

    std::string content;
    try {
      content = extractor_->extract_text(file);
    } catch (const ContentSourceError& e) {
      std::cerr << "Warning: [ExternalIndexer] Failed to read " << file << ": " << e.what() << std::endl;
      ++result.failed_count;
      result.failed_files.push_back(file_name);
      continue;
    }
    if (text::trim(content).empty()) {
      ++result.failed_count;
      result.failed_files.push_back(file_name);
      continue;
    }

    const std::string file_base = base_id + "_" + std::to_string(i);
    const ExtractedBlocks chunks = chunk(content, folder_name + "/" + file_name, file_base, kFolderType);
    debug_dump("Folder file " + file.string(), chunks);

    StoreOutcome outcome = store_chunks(chunks, doc_id, block_id, kFolderType, file.string());
    if (outcome.stored > 0) {
      ++result.success_count;
    } else {
      ++result.failed_count;
      result.failed_files.push_back(file_name);
    }
  }

  ExternalBlockContent snapshot;
  snapshot.id = snapshot_id(doc_id, block_id);
  snapshot.doc_id = doc_id;
  snapshot.block_id = block_id;
  snapshot.block_type = kFolderType;
  snapshot.file_path = folder_path;
  snapshot.title = folder_name;
  snapshot.raw_content = "Folder: " + folder_path + "\nTotal files: " + std::to_string(result.total_files) +
                         "\nIndexed: " + std::to_string(result.success_count);
  snapshot.extracted_at = now_seconds();
  store_->save_external_content(snapshot);

  std::cout << "[ExternalIndexer] Indexed folder " << folder_name << ": " << result.success_count << "/"
            << result.total_files << " files" << std::endl;
  return result;
}

int ExternalIndexer::reindex_all(const ProgressCallback& on_progress, const CancelCheck& is_cancelled) {
  struct Unit {
    std::string doc_id;
    std::string block_id;
    std::string kind;
    std::string target;
    std::string name;
  };

  std::vector<Unit> units;
  for (const auto& doc : repository_->get_all()) {
    std::string content;
    try {
      content = repository_->load(doc.id);
    } catch (const DocumentRepositoryError& e) {
      std::cerr << "Warning: [ExternalIndexer] Cannot load document " << doc.id << ": " << e.what()
                << std::endl;
      continue;
    }
    const ExternalRefs refs = extract_external_refs(content);
    for (const auto& b : refs.bookmarks) {
      if (!b.url.empty())
        units.push_back({doc.id, b.block_id, kBookmarkType, b.url, ""});
    }
    for (const auto& f : refs.files) {
      if (!f.file_path.empty())
        units.push_back({doc.id, f.block_id, kFileType, f.file_path, f.file_name});
    }
    for (const auto& f : refs.folders) {
      if (!f.folder_path.empty())
        units.push_back({doc.id, f.block_id, kFolderType, f.folder_path, f.folder_name});
    }
  }

  const int total = static_cast<int>(units.size());
  int indexed = 0;
  for (int i = 0; i < total; ++i) {
    if (is_cancelled && is_cancelled()) {
      std::cout << "[ExternalIndexer] Reindex cancelled after " << i << "/" << total << " blocks" << std::endl;
      break;
    }
    const Unit& unit = units[static_cast<size_t>(i)];
    try {
      if (unit.kind == kBookmarkType) {
        index_bookmark(unit.target, unit.doc_id, unit.block_id);
      } else if (unit.kind == kFileType) {
        index_file(unit.target, unit.doc_id, unit.block_id, unit.name);
      } else {
        index_folder(unit.target, unit.doc_id, unit.block_id, 0);
      }
      ++indexed;
    } catch (const std::exception& e) {
      std::cerr << "Warning: [ExternalIndexer] Failed to reindex " << unit.kind << " " << unit.target
                << " in " << unit.doc_id << ": " << e.what() << std::endl;
    }
    if (on_progress) {
      on_progress(i + 1, total);
    }
  }
  return indexed;
}

void ExternalIndexer::debug_dump(const std::string& title, const ExtractedBlocks& chunks) const {
  if (!debug_chunks_) {
    return;
  }
  std::cout << "\n[ExternalIndexer] " << title << "\n   Total chunks: " << chunks.size() << std::endl;
  for (size_t i = 0; i < chunks.size(); ++i) {
    std::cout << "   [" << i << "] " << std::left << std::setw(40) << chunks[i].id << " ("
              << text::char_length(chunks[i].content) << " chars): " << text::preview(chunks[i].content, 80)
              << std::endl;
  }
}

}  // namespace rag_core
