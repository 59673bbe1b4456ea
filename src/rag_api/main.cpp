#include <curl/curl.h>

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>

#include "rag_api/config.hpp"
#include "rag_api/routes.hpp"
#include "rag_api/server.hpp"
#include "rag_core/llm/embedding_provider_factory.hpp"
#include "rag_core/llm/http_client.hpp"
#include "rag_core/services/content_sources.hpp"
#include "rag_core/services/document_repository.hpp"
#include "rag_core/services/rag_service.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();
}

int main() {
  curl_global_init(CURL_GLOBAL_DEFAULT);
  try {
    const char* config_path = std::getenv("RAG_CONFIG");
    const std::string config_file = config_path ? config_path : "ragrc.json";
    rag_api::Config config = std::filesystem::exists(config_file)
                                 ? rag_api::Config::from_file(config_file)
                                 : rag_api::Config::from_json(nlohmann::json::object());

    std::cout << "Starting RAG API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Data Directory: " << config.data_directory << std::endl;
    std::cout << "Database: " << config.db_file_name << std::endl;
    std::cout << "Chunking: max " << config.max_chunk_size << ", overlap " << config.chunk_overlap
              << ", short " << config.short_block_threshold << ", merged " << config.max_merged_length
              << std::endl;

    auto http = std::make_shared<rag_core::CurlHttpClient>();
    auto repository = std::make_shared<rag_core::JsonDocumentRepository>(config.data_directory);
    auto extractor = std::make_shared<rag_core::PlainTextExtractor>();
    auto fetcher = std::make_shared<rag_core::CurlWebContentFetcher>(http);

    rag_core::RagServiceOptions options;
    options.data_dir = config.data_directory;
    options.db_file_name = config.db_file_name;
    options.pool_size = config.pool_size;
    options.chunk_config = config.chunk_config();

    auto rag_service = std::make_shared<rag_core::RagService>(
        options, repository,
        [http](const rag_core::EmbeddingConfig& embedding_config) {
          return std::shared_ptr<rag_core::EmbeddingProvider>(
              rag_core::create_embedding_provider(embedding_config, http));
        },
        extractor, fetcher);

    // The server still starts so the embedding config can be fixed through /config
    try {
      rag_service->initialize();
    } catch (const std::exception& e) {
      std::cerr << "Warning: RAG service not initialized: " << e.what() << std::endl;
    }

    const std::string& server_url = config.api_base_url;
    std::string host = server_url.substr(0, server_url.find(':'));
    int port = std::stoi(server_url.substr(server_url.find(':') + 1));
    rag_api::Server server(host, port);
    rag_api::Routes routes(rag_service, http);
    routes.register_routes(server);

    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.get_app().signal_clear();

    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    std::cout << "[1/2] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/2] Stopping background reindex and closing the database..." << std::endl;
    rag_service->shutdown();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    curl_global_cleanup();
    return 1;
  }

  curl_global_cleanup();
  return 0;
}
