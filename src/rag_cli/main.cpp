#include "rag_cli/cli_handler.hpp"
#include <iostream>
#include <cstdlib>

int main(int argc, char *argv[])
{
  curl_global_init(CURL_GLOBAL_DEFAULT);
  int exit_code = 0;
  try
  {
    const char *api_base_url = std::getenv("RAG_API_URL");
    std::string base_url = api_base_url ? api_base_url : "http://127.0.0.1:3040";

    rag_cli::CliOptions options = rag_cli::CliHandler::parse_arguments(argc, argv);
    rag_cli::CliHandler handler(base_url);
    handler.execute_command(options);
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    exit_code = 1;
  }
  curl_global_cleanup();
  return exit_code;
}
