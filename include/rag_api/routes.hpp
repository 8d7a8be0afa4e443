#pragma once
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "server.hpp"

// Forward declarations
namespace rag_core {
class StoreManager;
struct QueryResult;
}  // namespace rag_core

namespace rag_api {

// Malformed request body or missing required argument
class RequestError : public std::exception {
 public:
  explicit RequestError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class Routes {
 public:
  explicit Routes(std::shared_ptr<rag_core::StoreManager> store);
  ~Routes() = default;

  // Disable copy constructor and assignment
  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Allow move constructor and assignment
  Routes(Routes &&) noexcept = default;
  Routes &operator=(Routes &&) noexcept = default;

  // Register all routes with the server
  void register_routes(Server &server);

  // Tool bodies, callable without a running server. Throw RequestError on bad arguments.
  // A document naming a .txt or .md file is read from disk, with the file name as default source.
  nlohmann::json ingest_document(const nlohmann::json &arguments);
  nlohmann::json query_rag_store(const nlohmann::json &arguments);
  nlohmann::json list_documents() const;

  // Renders a prompt, querying the store for chunks when none are given.
  // Throws PromptError for an unknown prompt or a missing argument.
  nlohmann::json get_prompt(const std::string &name, const nlohmann::json &arguments);

  // Name, description and JSON schema of every tool
  static nlohmann::json tool_definitions();

  // Integer (or integral float) within int range; anything else is RequestError
  static int parse_top_k(const nlohmann::json &value);

 private:
  std::shared_ptr<rag_core::StoreManager> store_;

  // Route handlers
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_list_tools(const crow::request &req);
  crow::response handle_ingest_document(const crow::request &req);
  crow::response handle_query_rag_store(const crow::request &req);
  crow::response handle_list_documents(const crow::request &req);
  crow::response handle_list_prompts(const crow::request &req);
  crow::response handle_get_prompt(const crow::request &req, const std::string &name);

  static nlohmann::json results_to_json(const std::vector<rag_core::QueryResult> &results);

  // Helper methods
  nlohmann::json parse_json_body(const std::string &body);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error,
                                       const std::string &kind = std::string());
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
};

}  // namespace rag_api
