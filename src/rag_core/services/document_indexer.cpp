#include "rag_core/services/document_indexer.hpp"

#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <set>

#include "rag_core/chunking/block_parser.hpp"
#include "rag_core/utils/hash.hpp"
#include "rag_core/utils/text_utils.hpp"

namespace rag_core {

bool is_external_chunk_id(const std::string& id) {
  return id.find("_bookmark") != std::string::npos || id.find("_file") != std::string::npos ||
         id.find("_folder") != std::string::npos;
}

DocumentIndexer::DocumentIndexer(std::shared_ptr<VectorStore> store,
                                 std::shared_ptr<EmbeddingProvider> embedder,
                                 std::shared_ptr<DocumentRepository> repository,
                                 ChunkConfig config)
    : store_(std::move(store)),
      embedder_(std::move(embedder)),
      repository_(std::move(repository)),
      config_(config) {
  const char* debug = std::getenv("RAG_DEBUG_CHUNKS");
  debug_chunks_ = debug != nullptr && std::string(debug) == "1";
}

void DocumentIndexer::set_chunk_config(const ChunkConfig& config) {
  std::lock_guard<std::mutex> lock(config_mutex_);
  config_ = config;
}

ChunkConfig DocumentIndexer::chunk_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return config_;
}

BlockExtractor DocumentIndexer::extractor() const {
  return BlockExtractor(chunk_config());
}

IndexReport DocumentIndexer::index_document(const std::string& doc_id) {
  const std::string content = repository_->load(doc_id);
  const auto existing_hashes = store_->get_block_hashes(doc_id);

  auto blocks = parse_blocks(content);
  if (!blocks) {
    std::cerr << "Warning: [Indexer] Document " << doc_id << " is not a valid block tree, indexing no chunks"
              << std::endl;
    blocks.emplace();
  }
  const ExtractedBlocks chunks = extractor().extract(*blocks);
  debug_dump("Indexing document", doc_id, chunks);

  IndexReport report = embed_and_store(doc_id, chunks, existing_hashes);

  std::set<std::string> current_ids;
  for (const auto& chunk : chunks) {
    current_ids.insert(chunk.id);
  }
  std::vector<std::string> stale;
  for (const auto& [id, hash] : existing_hashes) {
    if (!current_ids.count(id) && !is_external_chunk_id(id)) {
      stale.push_back(id);
    }
  }
  if (!stale.empty()) {
    report.deleted = store_->delete_blocks(stale);
  }

  cleanup_orphan_external(doc_id, extract_external_refs(*blocks));
  return report;
}

IndexReport DocumentIndexer::force_reindex_document(const std::string& doc_id) {
  const std::string content = repository_->load(doc_id);

  IndexReport report;
  report.deleted = store_->delete_non_external_by_doc_id(doc_id);

  auto blocks = parse_blocks(content);
  if (!blocks) {
    std::cerr << "Warning: [Indexer] Document " << doc_id << " is not a valid block tree, indexing no chunks"
              << std::endl;
    blocks.emplace();
  }
  cleanup_orphan_external(doc_id, extract_external_refs(*blocks));

  const ExtractedBlocks chunks = extractor().extract(*blocks);
  debug_dump("Force reindexing document", doc_id, chunks);

  IndexReport embedded = embed_and_store(doc_id, chunks, {});
  embedded.deleted = report.deleted;
  return embedded;
}

IndexReport DocumentIndexer::embed_and_store(const std::string& doc_id,
                                             const ExtractedBlocks& chunks,
                                             const std::map<std::string, std::string>& existing_hashes) {
  IndexReport report;
  std::exception_ptr last_error;

  for (const auto& chunk : chunks) {
    if (chunk.content.empty()) {
      continue;
    }
    const std::string hash = hash_content(chunk.content + chunk.heading_context);

    auto existing = existing_hashes.find(chunk.id);
    if (existing != existing_hashes.end() && existing->second == hash) {
      ++report.skipped;
      continue;
    }

    std::vector<float> embedding;
    try {
      embedding = embedder_->embed(chunk.content);
    } catch (const EmbeddingServiceError& e) {
      std::cerr << "Warning: [Indexer] Failed to embed chunk " << chunk.id << ": " << e.what() << std::endl;
      ++report.failed;
      last_error = std::current_exception();
      continue;
    }

    BlockVector row;
    row.id = chunk.id;
    row.source_block_id = chunk.source_block_id.empty() ? chunk.id : chunk.source_block_id;
    row.doc_id = doc_id;
    row.content = chunk.content;
    row.content_hash = hash;
    row.block_type = chunk.type;
    row.heading_context = chunk.heading_context;
    row.embedding = std::move(embedding);
    try {
      store_->upsert(row);
    } catch (const VectorStoreError& e) {
      std::cerr << "Warning: [Indexer] Failed to store chunk " << chunk.id << ": " << e.what() << std::endl;
      ++report.failed;
      last_error = std::current_exception();
      continue;
    }
    ++report.embedded;
  }

  if (!report.succeeded() && last_error) {
    std::rethrow_exception(last_error);
  }
  return report;
}

void DocumentIndexer::cleanup_orphan_external(const std::string& doc_id, const ExternalRefs& refs) {
  store_->delete_orphan_external(doc_id, kBookmarkType, refs.bookmark_block_ids());
  for (const auto& path : store_->delete_orphan_external(doc_id, kFileType, refs.file_block_ids())) {
    std::cout << "[Indexer] File block removed from " << doc_id << ", attachment left in place: " << path
              << std::endl;
  }
  store_->delete_orphan_external(doc_id, kFolderType, refs.folder_block_ids());
}

ReindexSummary DocumentIndexer::reindex_all(const ProgressCallback& on_progress,
                                            const CancelCheck& is_cancelled) {
  const auto documents = repository_->get_all();

  std::set<std::string> known;
  for (const auto& doc : documents) {
    known.insert(doc.id);
  }
  for (const auto& doc_id : store_->get_all_doc_ids()) {
    if (!known.count(doc_id)) {
      std::cout << "[Indexer] Removing chunks of deleted document " << doc_id << std::endl;
      store_->delete_by_doc_id(doc_id);
    }
  }

  ReindexSummary summary;
  const int total = static_cast<int>(documents.size());
  int current = 0;
  for (const auto& doc : documents) {
    if (is_cancelled && is_cancelled()) {
      std::cout << "[Indexer] Reindex cancelled after " << current << "/" << total << " documents"
                << std::endl;
      break;
    }
    try {
      force_reindex_document(doc.id);
      ++summary.succeeded;
    } catch (const std::exception& e) {
      std::cerr << "Warning: [Indexer] Failed to reindex document " << doc.id << ": " << e.what()
                << std::endl;
      ++summary.failed;
      summary.failed_ids.push_back(doc.id);
    }
    ++current;
    if (on_progress) {
      on_progress(current, total);
    }
  }
  return summary;
}

int DocumentIndexer::delete_document(const std::string& doc_id) {
  return store_->delete_by_doc_id(doc_id);
}

void DocumentIndexer::debug_dump(const std::string& title,
                                 const std::string& doc_id,
                                 const ExtractedBlocks& chunks) const {
  if (!debug_chunks_) {
    return;
  }
  std::cout << "\n[Indexer] " << title << ": " << doc_id << "\n"
            << "   Total chunks: " << chunks.size() << std::endl;
  for (size_t i = 0; i < chunks.size(); ++i) {
    const auto& chunk = chunks[i];
    std::cout << "   [" << i << "] Type: " << std::left << std::setw(25) << chunk.type
              << " | Heading: " << text::preview(chunk.heading_context, 30) << "\n"
              << "       Content (" << text::char_length(chunk.content)
              << " chars): " << text::preview(chunk.content, 80) << std::endl;
  }
}

}  // namespace rag_core
