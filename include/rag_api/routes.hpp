#pragma once
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "server.hpp"

namespace rag_core {
class RagService;
class HttpClient;
}  // namespace rag_core

namespace rag_api {

class Routes {
 public:
  Routes(std::shared_ptr<rag_core::RagService> rag_service, std::shared_ptr<rag_core::HttpClient> http);
  ~Routes() = default;

  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  void register_routes(Server &server);

  // Route handlers, public so they can be exercised without a running server
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_index_document(const crow::request &req, const std::string &doc_id);
  crow::response handle_delete_document(const crow::request &req, const std::string &doc_id);
  crow::response handle_search(const crow::request &req);
  crow::response handle_search_chunks(const crow::request &req);
  crow::response handle_related(const crow::request &req, const std::string &doc_id);
  crow::response handle_graph(const crow::request &req);
  crow::response handle_stats(const crow::request &req);
  crow::response handle_index_bookmark(const crow::request &req);
  crow::response handle_index_file(const crow::request &req);
  crow::response handle_index_folder(const crow::request &req);
  crow::response handle_get_external(const crow::request &req,
                                     const std::string &doc_id,
                                     const std::string &block_id);
  crow::response handle_start_reindex(const crow::request &req);
  crow::response handle_reindex_status(const crow::request &req);
  crow::response handle_get_config(const crow::request &req);
  crow::response handle_update_config(const crow::request &req);
  crow::response handle_list_models(const crow::request &req);

  static nlohmann::json create_success_response(const std::string &message,
                                                const nlohmann::json &data = nlohmann::json{});
  static nlohmann::json create_error_response(const std::string &error);
  static crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);

 private:
  // Parses the body as a JSON object. An empty body is an empty object.
  static nlohmann::json parse_json_body(const std::string &body);

  std::shared_ptr<rag_core::RagService> rag_service_;
  std::shared_ptr<rag_core::HttpClient> http_;
};

}  // namespace rag_api
