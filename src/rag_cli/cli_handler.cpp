#include "rag_cli/cli_handler.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <memory>

namespace rag_cli {

namespace {

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

std::string url_encode(CURL* handle, const std::string& value) {
    char* escaped = curl_easy_escape(handle, value.c_str(), static_cast<int>(value.size()));
    if (!escaped) {
        throw CliError("Failed to encode URL component");
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

std::string shorten(const std::string& text, size_t max_len) {
    std::string flat = text;
    for (auto& c : flat) {
        if (c == '\n') c = ' ';
    }
    if (flat.size() <= max_len) {
        return flat;
    }
    size_t cut = max_len;
    // Do not cut inside a UTF-8 sequence
    while (cut > 0 && (static_cast<unsigned char>(flat[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return flat.substr(0, cut) + "...";
}

}  // namespace

CliHandler::CliHandler(const std::string& api_base_url)
    : api_base_url_(api_base_url), curl_handle_(curl_easy_init()) {
    if (!curl_handle_) {
        throw CliError("Failed to initialize CURL");
    }
}

CliHandler::~CliHandler() {
    if (curl_handle_) {
        curl_easy_cleanup(curl_handle_);
    }
}

size_t CliHandler::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;
    if (argc < 2) {
        return options;
    }

    const std::string command = argv[1];
    if (command == "index") {
        options.command = Command::Index;
    } else if (command == "search" || command == "s") {
        options.command = Command::Search;
    } else if (command == "chunks") {
        options.command = Command::Chunks;
    } else if (command == "related") {
        options.command = Command::Related;
    } else if (command == "graph") {
        options.command = Command::Graph;
    } else if (command == "stats") {
        options.command = Command::Stats;
    } else if (command == "reindex") {
        options.command = Command::Reindex;
    } else if (command == "status") {
        options.command = Command::Status;
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
        return options;
    } else {
        throw CliError("Unknown command: " + command);
    }

    for (int i = 2; i < argc; ++i) {
        const std::string flag = argv[i];
        if (flag == "--force") {
            options.force = true;
            continue;
        }
        if (i + 1 >= argc) {
            throw CliError("Missing value for " + flag);
        }
        const std::string value = argv[++i];
        try {
            if (flag == "--doc" || flag == "-d") {
                options.doc_id = value;
            } else if (flag == "--query" || flag == "-q") {
                options.query = value;
            } else if (flag == "--limit" || flag == "-l") {
                options.limit = std::stoi(value);
            } else if (flag == "--threshold" || flag == "-t") {
                options.threshold = std::stof(value);
            } else {
                throw CliError("Unknown flag: " + flag);
            }
        } catch (const std::logic_error&) {
            throw CliError("Invalid value for " + flag + ": " + value);
        }
    }

    const bool needs_doc = options.command == Command::Index || options.command == Command::Related;
    if (needs_doc && options.doc_id.empty()) {
        throw CliError(command + " requires a document ID. Usage: " + command + " --doc <id>");
    }
    const bool needs_query = options.command == Command::Search || options.command == Command::Chunks;
    if (needs_query && options.query.empty()) {
        throw CliError(command + " requires a query. Usage: " + command + " --query <query>");
    }
    if (options.limit <= 0) {
        throw CliError("--limit must be positive");
    }
    if (options.threshold < 0.0f || options.threshold > 1.0f) {
        throw CliError("--threshold must be between 0 and 1");
    }
    return options;
}

void CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Index:
            handle_index_command(options);
            break;
        case Command::Search:
            handle_search_command(options);
            break;
        case Command::Chunks:
            handle_chunks_command(options);
            break;
        case Command::Related:
            handle_related_command(options);
            break;
        case Command::Graph:
            handle_graph_command(options);
            break;
        case Command::Stats:
            handle_stats_command(options);
            break;
        case Command::Reindex:
            handle_reindex_command(options);
            break;
        case Command::Status:
            handle_status_command(options);
            break;
        case Command::Help:
            print_help();
            break;
    }
}

void CliHandler::handle_index_command(const CliOptions& options) {
    std::cout << (options.force ? "Force reindexing " : "Indexing ") << options.doc_id << std::endl;
    const nlohmann::json body = {{"force", options.force}};
    const nlohmann::json response =
        make_request("POST", "/documents/" + url_encode(curl_handle_, options.doc_id) + "/index", &body);
    const auto& data = response["data"];
    std::cout << "Embedded: " << data.value("embedded", 0) << ", skipped: " << data.value("skipped", 0)
              << ", deleted: " << data.value("deleted", 0) << ", failed: " << data.value("failed", 0)
              << std::endl;
}

void CliHandler::handle_search_command(const CliOptions& options) {
    std::cout << "Searching documents for: " << options.query << " (limit: " << options.limit << ")"
              << std::endl;
    nlohmann::json body = {{"query", options.query}, {"limit", options.limit}};
    if (!options.doc_id.empty()) {
        body["docId"] = options.doc_id;
    }
    print_documents(make_request("POST", "/search", &body));
}

void CliHandler::handle_chunks_command(const CliOptions& options) {
    std::cout << "Searching chunks for: " << options.query << " (limit: " << options.limit << ")"
              << std::endl;
    nlohmann::json body = {{"query", options.query}, {"limit", options.limit}};
    if (!options.doc_id.empty()) {
        body["docId"] = options.doc_id;
    }
    print_chunks(make_request("POST", "/search/chunks", &body));
}

void CliHandler::handle_related_command(const CliOptions& options) {
    std::cout << "Documents related to " << options.doc_id << std::endl;
    print_documents(make_request("GET", "/documents/" + url_encode(curl_handle_, options.doc_id) +
                                            "/related?limit=" + std::to_string(options.limit)));
}

void CliHandler::handle_graph_command(const CliOptions& options) {
    std::ostringstream endpoint;
    endpoint << "/graph?threshold=" << options.threshold;
    const nlohmann::json graph = make_request("GET", endpoint.str());

    std::cout << "\n=== Graph (threshold " << options.threshold << ") ===" << std::endl;
    std::cout << "Nodes: " << graph["nodes"].size() << ", links: " << graph["links"].size() << std::endl;
    for (const auto& link : graph["links"]) {
        std::cout << "  " << link["source"].get<std::string>() << " <-> " << link["target"].get<std::string>()
                  << " (" << std::fixed << std::setprecision(3) << link["similarity"].get<float>() << ")";
        if (link.value("hasTags", false)) {
            std::cout << " [tags]";
        }
        std::cout << std::endl;
    }
}

void CliHandler::handle_stats_command(const CliOptions&) {
    const nlohmann::json stats = make_request("GET", "/stats");
    std::cout << "Documents: " << stats.value("documents", 0) << std::endl;
    std::cout << "Bookmarks: " << stats.value("bookmarks", 0) << std::endl;
    std::cout << "Files:     " << stats.value("files", 0) << std::endl;
    std::cout << "Folders:   " << stats.value("folders", 0) << std::endl;
}

void CliHandler::handle_reindex_command(const CliOptions&) {
    const nlohmann::json response = make_request("POST", "/reindex");
    std::cout << response.value("message", std::string("Reindex started")) << std::endl;
    std::cout << "Use 'status' to follow its progress." << std::endl;
}

void CliHandler::handle_status_command(const CliOptions&) {
    const nlohmann::json progress = make_request("GET", "/reindex/status");
    std::cout << "Running:   " << (progress.value("running", false) ? "yes" : "no") << std::endl;
    std::cout << "Phase:     " << progress.value("phase", std::string("-")) << std::endl;
    std::cout << "Progress:  " << progress.value("current", 0) << "/" << progress.value("total", 0) << std::endl;
    std::cout << "Succeeded: " << progress.value("succeeded", 0) << ", failed: " << progress.value("failed", 0)
              << std::endl;
}

nlohmann::json CliHandler::make_request(const std::string& method,
                                        const std::string& endpoint,
                                        const nlohmann::json* data) {
    const std::string url = build_url(endpoint);
    const std::string request_json = data ? data->dump() : std::string();
    std::string response_buffer;

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);

    std::unique_ptr<curl_slist, SlistDeleter> headers;
    if (method == "POST") {
        headers.reset(curl_slist_append(nullptr, "Content-Type: application/json"));
        curl_easy_setopt(curl_handle_, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, request_json.c_str());
        curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDSIZE, static_cast<long>(request_json.size()));
        curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers.get());
    } else if (method != "GET") {
        curl_easy_setopt(curl_handle_, CURLOPT_CUSTOMREQUEST, method.c_str());
    }

    CURLcode res = curl_easy_perform(curl_handle_);
    if (res != CURLE_OK) {
        throw CliError("CURL request failed: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);

    nlohmann::json parsed = nlohmann::json::parse(response_buffer, nullptr, false);
    if (http_code < 200 || http_code >= 300) {
        std::string message = "HTTP request failed with status code: " + std::to_string(http_code);
        if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("error")) {
            message += " (" + parsed["error"].get<std::string>() + ")";
        }
        throw CliError(message);
    }
    if (parsed.is_discarded()) {
        throw CliError("Server returned invalid JSON");
    }
    return parsed;
}

std::string CliHandler::build_url(const std::string& endpoint) const {
    std::string base = api_base_url_;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + endpoint;
}

void CliHandler::print_documents(const nlohmann::json& response) {
    std::cout << "\n=== Documents ===" << std::endl;
    if (!response.is_array() || response.empty()) {
        std::cout << "No results found." << std::endl;
        return;
    }
    for (const auto& doc : response) {
        std::string title = doc.value("docTitle", std::string());
        if (title.empty()) {
            title = doc.value("docId", std::string());
        }
        std::cout << "  • " << title << " (score: " << std::fixed << std::setprecision(3)
                  << doc.value("maxScore", 0.0f) << ")" << std::endl;
        for (const auto& chunk : doc["matchedChunks"]) {
            std::cout << "      - " << std::setprecision(3) << chunk.value("score", 0.0f) << "  "
                      << shorten(chunk.value("content", std::string()), 100) << std::endl;
        }
    }
}

void CliHandler::print_chunks(const nlohmann::json& response) {
    std::cout << "\n=== Chunks ===" << std::endl;
    if (!response.is_array() || response.empty()) {
        std::cout << "No results found." << std::endl;
        return;
    }
    for (const auto& chunk : response) {
        std::cout << "  • " << chunk.value("docId", std::string()) << " / " << chunk.value("blockId", std::string())
                  << " [" << chunk.value("sourceType", std::string()) << "]"
                  << " | Score: " << std::fixed << std::setprecision(3) << chunk.value("score", 0.0f) << std::endl;
        std::cout << "    " << shorten(chunk.value("content", std::string()), 100) << std::endl << std::endl;
    }
}

void CliHandler::print_help() {
    std::cout << R"(
RAG CLI - semantic search over your notes

Usage: rag_cli <command> [options]

Commands:
  index         Index a document
    --doc, -d <id>          Document ID
    --force                 Re-embed every chunk

  search, s     Search documents
    --query, -q <query>     Search query
    --limit, -l <num>       Number of documents (default: 5)
    --doc, -d <id>          Restrict to one document

  chunks        Search individual chunks
    --query, -q <query>     Search query
    --limit, -l <num>       Number of chunks (default: 5)
    --doc, -d <id>          Restrict to one document

  related       Documents similar to a document
    --doc, -d <id>          Document ID
    --limit, -l <num>       Number of documents (default: 5)

  graph         Similarity graph summary
    --threshold, -t <0..1>  Minimum similarity (default: 0.5)

  stats         Counts of indexed documents, bookmarks, files and folders
  reindex       Start a full background reindex
  status        Progress of the background reindex
  help, h       Show this help message

Environment:
  RAG_API_URL   Server address (default: http://127.0.0.1:3040)
)" << std::endl;
}

}  // namespace rag_cli
