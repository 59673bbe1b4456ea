#include "rag_api/routes.hpp"

#include <iostream>
#include <stdexcept>

#include "rag_core/llm/embedding_provider_factory.hpp"
#include "rag_core/services/rag_service.hpp"

namespace rag_api {

namespace {

using nlohmann::json;

json chunk_to_json(const rag_core::ChunkMatch &chunk) {
  json j;
  j["blockId"] = chunk.block_id;
  j["sourceBlockId"] = chunk.source_block_id ? json(*chunk.source_block_id) : json(nullptr);
  j["sourceType"] = chunk.source_type;
  j["sourceTitle"] = chunk.source_title;
  j["content"] = chunk.content;
  j["blockType"] = chunk.block_type;
  j["headingContext"] = chunk.heading_context;
  j["score"] = chunk.score;
  j["docId"] = chunk.doc_id;
  return j;
}

json documents_to_json(const std::vector<rag_core::DocumentSearchResult> &results) {
  json out = json::array();
  for (const auto &result : results) {
    json chunks = json::array();
    for (const auto &chunk : result.matched_chunks) {
      chunks.push_back(chunk_to_json(chunk));
    }
    out.push_back({{"docId", result.doc_id},
                   {"docTitle", result.doc_title},
                   {"maxScore", result.max_score},
                   {"matchedChunks", chunks}});
  }
  return out;
}

json report_to_json(const rag_core::IndexReport &report) {
  return {{"embedded", report.embedded},
          {"skipped", report.skipped},
          {"deleted", report.deleted},
          {"failed", report.failed}};
}

json progress_to_json(const rag_core::async::ReindexProgress &progress) {
  return {{"running", progress.running},
          {"phase", progress.phase},
          {"current", progress.current},
          {"total", progress.total},
          {"succeeded", progress.succeeded},
          {"failed", progress.failed}};
}

std::string required_string(const json &body, const char *key) {
  auto it = body.find(key);
  if (it == body.end() || !it->is_string() || it->get<std::string>().empty()) {
    throw std::invalid_argument(std::string("missing required field: ") + key);
  }
  return it->get<std::string>();
}

int int_param(const crow::request &req, const char *key, int fallback) {
  const char *value = req.url_params.get(key);
  if (value == nullptr) {
    return fallback;
  }
  try {
    return std::stoi(value);
  } catch (const std::logic_error &) {
    throw std::invalid_argument(std::string("invalid integer for ") + key);
  }
}

// Maps engine exceptions onto HTTP statuses
template <typename Handler>
crow::response guarded(const char *name, Handler &&handler) {
  int status = 500;
  std::string message;
  try {
    return handler();
  } catch (const rag_core::EmbeddingServiceError &e) {
    status = e.is_unrecoverable() ? 502 : 503;
    message = e.what();
  } catch (const rag_core::RagServiceError &e) {
    status = 503;
    message = e.what();
  } catch (const rag_core::ContentSourceError &e) {
    status = 400;
    message = e.what();
  } catch (const rag_core::DocumentRepositoryError &e) {
    status = 400;
    message = e.what();
  } catch (const json::exception &e) {
    status = 400;
    message = e.what();
  } catch (const std::invalid_argument &e) {
    status = 400;
    message = e.what();
  } catch (const std::exception &e) {
    status = 500;
    message = e.what();
  }
  std::cerr << "Exception in " << name << " (" << status << "): " << message << std::endl;
  return Routes::create_json_response(Routes::create_error_response(message), status);
}

}  // namespace

Routes::Routes(std::shared_ptr<rag_core::RagService> rag_service, std::shared_ptr<rag_core::HttpClient> http)
    : rag_service_(std::move(rag_service)), http_(std::move(http)) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/documents/<string>/index")
      .methods(crow::HTTPMethod::POST)([this](const crow::request &req, const std::string &doc_id) {
        return handle_index_document(req, doc_id);
      });

  CROW_ROUTE(app, "/documents/<string>")
      .methods(crow::HTTPMethod::DELETE)([this](const crow::request &req, const std::string &doc_id) {
        return handle_delete_document(req, doc_id);
      });

  CROW_ROUTE(app, "/documents/<string>/related")
  ([this](const crow::request &req, const std::string &doc_id) { return handle_related(req, doc_id); });

  CROW_ROUTE(app, "/search").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_search(req);
  });

  CROW_ROUTE(app, "/search/chunks").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_search_chunks(req);
  });

  CROW_ROUTE(app, "/graph")
  ([this](const crow::request &req) { return handle_graph(req); });

  CROW_ROUTE(app, "/stats")
  ([this](const crow::request &req) { return handle_stats(req); });

  CROW_ROUTE(app, "/external/bookmark").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_index_bookmark(req);
  });

  CROW_ROUTE(app, "/external/file").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_index_file(req);
  });

  CROW_ROUTE(app, "/external/folder").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_index_folder(req);
  });

  CROW_ROUTE(app, "/external/<string>/<string>")
  ([this](const crow::request &req, const std::string &doc_id, const std::string &block_id) {
    return handle_get_external(req, doc_id, block_id);
  });

  CROW_ROUTE(app, "/reindex").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_start_reindex(req);
  });

  CROW_ROUTE(app, "/reindex/status")
  ([this](const crow::request &req) { return handle_reindex_status(req); });

  CROW_ROUTE(app, "/config")
      .methods(crow::HTTPMethod::GET, crow::HTTPMethod::POST)([this](const crow::request &req) {
        if (req.method == crow::HTTPMethod::POST) {
          return handle_update_config(req);
        }
        return handle_get_config(req);
      });

  CROW_ROUTE(app, "/models")
  ([this](const crow::request &req) { return handle_list_models(req); });

  std::cout << "All routes registered successfully" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request &) {
  json response = create_success_response("RAG API is running");
  response["status"] = "healthy";
  response["initialized"] = rag_service_->is_initialized();
  return create_json_response(response);
}

crow::response Routes::handle_index_document(const crow::request &req, const std::string &doc_id) {
  return guarded("handle_index_document", [&] {
    const json body = parse_json_body(req.body);
    const bool force = body.value("force", false);
    std::cout << (force ? "Force reindexing document: " : "Indexing document: ") << doc_id << std::endl;

    const rag_core::IndexReport report =
        force ? rag_service_->force_reindex_document(doc_id) : rag_service_->index_document(doc_id);
    return create_json_response(create_success_response("Document indexed", report_to_json(report)));
  });
}

crow::response Routes::handle_delete_document(const crow::request &, const std::string &doc_id) {
  return guarded("handle_delete_document", [&] {
    const int removed = rag_service_->delete_document(doc_id);
    return create_json_response(create_success_response("Document removed from index", {{"deleted", removed}}));
  });
}

crow::response Routes::handle_search(const crow::request &req) {
  return guarded("handle_search", [&] {
    const json body = parse_json_body(req.body);
    const std::string query = required_string(body, "query");
    rag_core::SearchFilter filter;
    filter.doc_id = body.value("docId", std::string());
    filter.exclude_doc_id = body.value("excludeDocId", std::string());
    const int limit = body.value("limit", 10);

    std::cout << "Document search for: " << query << " with limit: " << limit << std::endl;
    return create_json_response(documents_to_json(rag_service_->search_documents(query, limit, filter)));
  });
}

crow::response Routes::handle_search_chunks(const crow::request &req) {
  return guarded("handle_search_chunks", [&] {
    const json body = parse_json_body(req.body);
    const std::string query = required_string(body, "query");
    rag_core::SearchFilter filter;
    filter.doc_id = body.value("docId", std::string());
    filter.source_block_id = body.value("sourceBlockId", std::string());
    const int limit = body.value("limit", 10);

    std::cout << "Chunk search for: " << query << " with limit: " << limit << std::endl;
    json results = json::array();
    for (const auto &chunk : rag_service_->search_chunks(query, limit, filter)) {
      results.push_back(chunk_to_json(chunk));
    }
    return create_json_response(results);
  });
}

crow::response Routes::handle_related(const crow::request &req, const std::string &doc_id) {
  return guarded("handle_related", [&] {
    const int limit = int_param(req, "limit", 5);
    return create_json_response(documents_to_json(rag_service_->search_related(doc_id, limit)));
  });
}

crow::response Routes::handle_graph(const crow::request &req) {
  return guarded("handle_graph", [&] {
    float threshold = rag_core::GraphService::kDefaultThreshold;
    if (const char *value = req.url_params.get("threshold")) {
      try {
        threshold = std::stof(value);
      } catch (const std::logic_error &) {
        throw std::invalid_argument("invalid threshold");
      }
    }
    if (threshold < 0.0f || threshold > 1.0f) {
      throw std::invalid_argument("threshold must be between 0 and 1");
    }

    const rag_core::GraphData graph = rag_service_->build_graph(threshold);
    json nodes = json::array();
    for (const auto &node : graph.nodes) {
      json n = {{"id", node.id}, {"type", node.type}, {"title", node.title}, {"tags", node.tags},
                {"val", node.val}};
      if (!node.parent_doc_id.empty()) {
        n["parentDocId"] = node.parent_doc_id;
        n["parentBlockId"] = node.parent_block_id;
      }
      nodes.push_back(std::move(n));
    }
    json links = json::array();
    for (const auto &link : graph.links) {
      links.push_back({{"source", link.source},
                       {"target", link.target},
                       {"similarity", link.similarity},
                       {"hasSemantic", link.has_semantic},
                       {"hasTags", link.has_tags}});
    }
    return create_json_response({{"nodes", nodes}, {"links", links}});
  });
}

crow::response Routes::handle_stats(const crow::request &) {
  return guarded("handle_stats", [&] {
    const rag_core::IndexStats stats = rag_service_->get_indexed_stats();
    return create_json_response({{"documents", stats.documents},
                                 {"bookmarks", stats.bookmarks},
                                 {"files", stats.files},
                                 {"folders", stats.folders}});
  });
}

crow::response Routes::handle_index_bookmark(const crow::request &req) {
  return guarded("handle_index_bookmark", [&] {
    const json body = parse_json_body(req.body);
    const int chunks = rag_service_->index_bookmark(required_string(body, "url"), required_string(body, "docId"),
                                                    required_string(body, "blockId"));
    return create_json_response(create_success_response("Bookmark indexed", {{"chunks", chunks}}));
  });
}

crow::response Routes::handle_index_file(const crow::request &req) {
  return guarded("handle_index_file", [&] {
    const json body = parse_json_body(req.body);
    const int chunks =
        rag_service_->index_file(required_string(body, "filePath"), required_string(body, "docId"),
                                 required_string(body, "blockId"), body.value("fileName", std::string()));
    return create_json_response(create_success_response("File indexed", {{"chunks", chunks}}));
  });
}

crow::response Routes::handle_index_folder(const crow::request &req) {
  return guarded("handle_index_folder", [&] {
    const json body = parse_json_body(req.body);
    const rag_core::FolderIndexResult result =
        rag_service_->index_folder(required_string(body, "folderPath"), required_string(body, "docId"),
                                   required_string(body, "blockId"), body.value("maxDepth", 0));
    return create_json_response(create_success_response("Folder indexed",
                                                        {{"totalFiles", result.total_files},
                                                         {"successCount", result.success_count},
                                                         {"failedCount", result.failed_count},
                                                         {"failedFiles", result.failed_files}}));
  });
}

crow::response Routes::handle_get_external(const crow::request &,
                                           const std::string &doc_id,
                                           const std::string &block_id) {
  return guarded("handle_get_external", [&] {
    const auto content = rag_service_->get_external_content(doc_id, block_id);
    if (!content) {
      return create_json_response(create_error_response("External content not found"), 404);
    }
    return create_json_response({{"id", content->id},
                                 {"docId", content->doc_id},
                                 {"blockId", content->block_id},
                                 {"blockType", content->block_type},
                                 {"url", content->url},
                                 {"filePath", content->file_path},
                                 {"title", content->title},
                                 {"rawContent", content->raw_content},
                                 {"extractedAt", content->extracted_at}});
  });
}

crow::response Routes::handle_start_reindex(const crow::request &) {
  return guarded("handle_start_reindex", [&] {
    if (!rag_service_->start_background_reindex()) {
      return create_json_response(create_error_response("A reindex is already running"), 409);
    }
    return create_json_response(create_success_response("Reindex started"));
  });
}

crow::response Routes::handle_reindex_status(const crow::request &) {
  return create_json_response(progress_to_json(rag_service_->reindex_progress()));
}

crow::response Routes::handle_get_config(const crow::request &) {
  return guarded("handle_get_config", [&] {
    json config = rag_service_->embedding_config().to_json();
    if (config.contains("apiKey") && !config["apiKey"].get<std::string>().empty()) {
      config["apiKey"] = "********";
    }
    return create_json_response(config);
  });
}

crow::response Routes::handle_update_config(const crow::request &req) {
  return guarded("handle_update_config", [&] {
    const json body = parse_json_body(req.body);
    const rag_core::EmbeddingConfig config = rag_core::EmbeddingConfig::from_json(body);
    const rag_core::ConnectionTestResult test = rag_core::test_connection(config, http_);
    if (!test.success) {
      return create_json_response(create_error_response("Connection test failed: " + test.error), 400);
    }
    const bool reindex_started = rag_service_->update_embedding_config(config);
    return create_json_response(create_success_response(
        "Configuration saved", {{"dimension", test.dimension}, {"reindexStarted", reindex_started}}));
  });
}

crow::response Routes::handle_list_models(const crow::request &req) {
  return guarded("handle_list_models", [&] {
    const rag_core::EmbeddingConfig current = rag_service_->embedding_config();
    const char *provider = req.url_params.get("provider");
    const char *base_url = req.url_params.get("baseUrl");
    const char *api_key = req.url_params.get("apiKey");
    try {
      const auto models = rag_core::list_models(*http_, provider ? provider : current.provider,
                                                base_url ? base_url : current.base_url,
                                                api_key ? api_key : current.api_key);
      return create_json_response({{"models", models}});
    } catch (const std::runtime_error &e) {
      return create_json_response(create_error_response(e.what()), 502);
    }
  });
}

crow::response Routes::create_json_response(const json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

json Routes::create_success_response(const std::string &message, const json &data) {
  json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

json Routes::create_error_response(const std::string &error) {
  json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

json Routes::parse_json_body(const std::string &body) {
  if (body.empty()) {
    return json::object();
  }
  json parsed = json::parse(body, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    throw std::invalid_argument("request body must be a JSON object");
  }
  return parsed;
}

}  // namespace rag_api
