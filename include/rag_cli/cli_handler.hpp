#pragma once

#include <string>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace rag_cli
{

  enum class Command
  {
    Index,
    Search,
    Chunks,
    Related,
    Graph,
    Stats,
    Reindex,
    Status,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string doc_id;
    std::string query;
    int limit = 5;
    bool force = false;
    float threshold = 0.5f;
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  class CliHandler
  {
  public:
    explicit CliHandler(const std::string &api_base_url);
    ~CliHandler();

    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Throws CliError for unknown commands, flags or missing required values
    static CliOptions parse_arguments(int argc, char *argv[]);

    void execute_command(const CliOptions &options);

    std::string build_url(const std::string &endpoint) const;

  private:
    std::string api_base_url_;
    CURL *curl_handle_;

    // Command handlers
    void handle_index_command(const CliOptions &options);
    void handle_search_command(const CliOptions &options);
    void handle_chunks_command(const CliOptions &options);
    void handle_related_command(const CliOptions &options);
    void handle_graph_command(const CliOptions &options);
    void handle_stats_command(const CliOptions &options);
    void handle_reindex_command(const CliOptions &options);
    void handle_status_command(const CliOptions &options);

    // HTTP. Non-2xx responses throw CliError with the server's error message.
    nlohmann::json make_request(const std::string &method,
                                const std::string &endpoint,
                                const nlohmann::json *data = nullptr);
    static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);

    void print_documents(const nlohmann::json &response);
    void print_chunks(const nlohmann::json &response);
    void print_help();
  };

}
