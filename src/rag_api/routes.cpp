#include "rag_api/routes.hpp"

#include <climits>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <nlohmann/json.hpp>

#include "rag_api/prompts.hpp"
#include "rag_core/errors.hpp"
#include "rag_core/extractors/document_parser.hpp"
#include "rag_core/services/store_manager.hpp"

namespace rag_api {
Routes::Routes(std::shared_ptr<rag_core::StoreManager> store) : store_(store) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  // Health check endpoint
  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/tools")
  ([this](const crow::request &req) { return handle_list_tools(req); });

  CROW_ROUTE(app, "/ingest_document")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_ingest_document(req); });

  CROW_ROUTE(app, "/query_rag_store")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_query_rag_store(req); });

  CROW_ROUTE(app, "/documents")
  ([this](const crow::request &req) { return handle_list_documents(req); });

  CROW_ROUTE(app, "/prompts")
  ([this](const crow::request &req) { return handle_list_prompts(req); });

  CROW_ROUTE(app, "/prompts/<string>")
      .methods(crow::HTTPMethod::POST)([this](const crow::request &req, const std::string &name) {
        return handle_get_prompt(req, name);
      });

  std::cout << "All routes registered successfully" << std::endl;
}

nlohmann::json Routes::tool_definitions() {
  nlohmann::json ingest_schema = {
      {"type", "object"},
      {"properties",
       {{"document",
         {{"type", "string"},
          {"description",
           "The text content of the document to ingest, or a path to a .txt or .md file"}}},
        {"source",
         {{"type", "string"},
          {"description", "Optional source identifier for the document (e.g., filename, URL)"},
          {"default", "unknown"}}}}},
      {"required", {"document"}}};

  nlohmann::json query_schema = {
      {"type", "object"},
      {"properties",
       {{"query", {{"type", "string"}, {"description", "The search query text"}}},
        {"top_k",
         {{"type", "number"},
          {"description", "Number of top results to return"},
          {"default", 3}}}}},
      {"required", {"query"}}};

  nlohmann::json tools = nlohmann::json::array();
  tools.push_back({{"name", "ingest_document"},
                   {"description",
                    "Ingest a document into the vector store. The document will be chunked, "
                    "embedded, and stored for later retrieval."},
                   {"input_schema", ingest_schema}});
  tools.push_back({{"name", "query_rag_store"},
                   {"description",
                    "Query the vector store to retrieve relevant document chunks based on "
                    "semantic similarity."},
                   {"input_schema", query_schema}});
  return tools;
}

nlohmann::json Routes::ingest_document(const nlohmann::json &arguments) {
  if (!arguments.is_object() || !arguments.contains("document") ||
      !arguments["document"].is_string()) {
    throw RequestError("Missing required string argument 'document'");
  }
  bool has_source = arguments.contains("source") && !arguments["source"].is_null();
  std::string source = "unknown";
  if (has_source) {
    if (!arguments["source"].is_string()) {
      throw RequestError("Argument 'source' must be a string");
    }
    source = arguments["source"].get<std::string>();
  }

  std::string document = arguments["document"].get<std::string>();
  if (rag_core::is_file_path(document)) {
    const fs::path file_path(document);
    try {
      document = rag_core::parse_document(file_path);
    } catch (const rag_core::DocumentParseError &e) {
      throw RequestError(e.what());
    }
    if (!has_source) {
      source = file_path.filename().string();
    }
  }

  rag_core::IngestResult result = store_->ingest(document, source);

  nlohmann::json response;
  response["success"] = result.success;
  response["chunks_added"] = result.chunks_added;
  response["total_documents"] = result.total_documents;
  if (!result.success) {
    response["error"] = result.error_message;
    if (result.error_kind.has_value()) {
      response["kind"] = rag_core::to_string(*result.error_kind);
    }
  }
  return response;
}

nlohmann::json Routes::query_rag_store(const nlohmann::json &arguments) {
  if (!arguments.is_object() || !arguments.contains("query") ||
      !arguments["query"].is_string()) {
    throw RequestError("Missing required string argument 'query'");
  }
  int top_k = store_->settings().default_top_k;
  if (arguments.contains("top_k") && !arguments["top_k"].is_null()) {
    top_k = parse_top_k(arguments["top_k"]);
  }

  std::vector<rag_core::QueryResult> results =
      store_->query(arguments["query"].get<std::string>(), top_k);

  nlohmann::json response;
  response["results"] = results_to_json(results);
  response["count"] = results.size();
  return response;
}

nlohmann::json Routes::get_prompt(const std::string &name, const nlohmann::json &arguments) {
  if (!PromptLibrary::has_prompt(name)) {
    throw PromptError("Unknown prompt: " + name);
  }
  if (!arguments.is_object()) {
    throw RequestError("Prompt arguments must be a JSON object");
  }

  nlohmann::json prompt_arguments = arguments;
  if (!arguments.contains("chunks")) {
    const std::string key = name == "extract-answer" ? "query" : "topic";
    if (arguments.contains(key) && arguments[key].is_string()) {
      int top_k = store_->settings().default_top_k;
      if (arguments.contains("top_k") && !arguments["top_k"].is_null()) {
        top_k = parse_top_k(arguments["top_k"]);
      }
      prompt_arguments["chunks"] =
          results_to_json(store_->query(arguments[key].get<std::string>(), top_k));
    }
  }

  nlohmann::json content;
  content["type"] = "text";
  content["text"] = PromptLibrary::render(name, prompt_arguments);

  nlohmann::json message;
  message["role"] = "user";
  message["content"] = content;

  nlohmann::json response;
  response["name"] = name;
  response["messages"] = nlohmann::json::array({message});
  return response;
}

int Routes::parse_top_k(const nlohmann::json &value) {
  if (value.is_number_unsigned()) {
    if (value.get<uint64_t>() > static_cast<uint64_t>(INT_MAX)) {
      throw RequestError("Argument 'top_k' is out of range");
    }
    return static_cast<int>(value.get<uint64_t>());
  }
  if (value.is_number_integer()) {
    const int64_t top_k = value.get<int64_t>();
    if (top_k < INT_MIN || top_k > INT_MAX) {
      throw RequestError("Argument 'top_k' is out of range");
    }
    return static_cast<int>(top_k);
  }
  if (value.is_number_float()) {
    const double top_k = value.get<double>();
    if (!std::isfinite(top_k) || std::floor(top_k) != top_k) {
      throw RequestError("Argument 'top_k' must be a whole number");
    }
    if (top_k < static_cast<double>(INT_MIN) || top_k > static_cast<double>(INT_MAX)) {
      throw RequestError("Argument 'top_k' is out of range");
    }
    return static_cast<int>(top_k);
  }
  throw RequestError("Argument 'top_k' must be a number");
}

nlohmann::json Routes::results_to_json(const std::vector<rag_core::QueryResult> &results) {
  nlohmann::json results_json = nlohmann::json::array();
  for (const auto &result : results) {
    nlohmann::json result_json;
    result_json["text"] = result.text;
    result_json["source"] = result.source;
    result_json["chunk_index"] = result.chunk_index;
    result_json["distance"] = result.distance;
    if (result.rerank_score.has_value()) {
      result_json["rerank_score"] = *result.rerank_score;
    }
    results_json.push_back(result_json);
  }
  return results_json;
}

nlohmann::json Routes::list_documents() const {
  std::vector<rag_core::DocumentSummary> summaries = store_->list_documents();

  nlohmann::json documents = nlohmann::json::array();
  for (const auto &summary : summaries) {
    nlohmann::json document;
    document["source"] = summary.source;
    document["chunks"] = summary.chunks;
    if (!summary.indexed_at.empty()) {
      document["indexed_at"] = summary.indexed_at;
    }
    documents.push_back(document);
  }

  nlohmann::json response;
  response["documents"] = documents;
  response["total"] = summaries.size();
  return response;
}

crow::response Routes::handle_health_check(const crow::request &req) {
  nlohmann::json response = create_success_response("RAG store API is running");
  response["version"] = "0.1.0";
  response["status"] = "healthy";
  response["documents"] = store_->size();
  response["embedding_model"] = store_->model_name();
  std::string reranker = store_->reranker_name();
  if (!reranker.empty()) {
    response["rerank_model"] = reranker;
  }
  return create_json_response(response);
}

crow::response Routes::handle_list_tools(const crow::request &req) {
  nlohmann::json response;
  response["tools"] = tool_definitions();
  return create_json_response(response);
}

crow::response Routes::handle_ingest_document(const crow::request &req) {
  try {
    nlohmann::json arguments = parse_json_body(req.body);
    std::cout << "Ingesting document from: " << arguments.value("source", "unknown")
              << std::endl;
    nlohmann::json response = ingest_document(arguments);
    return create_json_response(response, response["success"].get<bool>() ? 200 : 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_ingest_document: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 400);
  }
}

crow::response Routes::handle_query_rag_store(const crow::request &req) {
  try {
    nlohmann::json arguments = parse_json_body(req.body);
    std::cout << "Query: " << arguments.value("query", "") << std::endl;
    nlohmann::json response = query_rag_store(arguments);
    std::cout << "Query results: " << response["count"] << std::endl;
    return create_json_response(response);
  } catch (const rag_core::StoreError &e) {
    std::cerr << rag_core::format_store_error("query_rag_store", e) << std::endl;
    return create_json_response(
        create_error_response(e.what(), rag_core::to_string(e.kind())), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_query_rag_store: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 400);
  }
}

crow::response Routes::handle_list_documents(const crow::request &req) {
  try {
    std::cout << "Listing documents" << std::endl;
    return create_json_response(list_documents());
  } catch (const std::exception &e) {
    return create_json_response(create_error_response(e.what()), 400);
  }
}

crow::response Routes::handle_list_prompts(const crow::request &req) {
  nlohmann::json response;
  response["prompts"] = PromptLibrary::definitions_json();
  return create_json_response(response);
}

crow::response Routes::handle_get_prompt(const crow::request &req, const std::string &name) {
  if (!PromptLibrary::has_prompt(name)) {
    return create_json_response(create_error_response("Unknown prompt: " + name), 404);
  }
  try {
    nlohmann::json arguments =
        req.body.empty() ? nlohmann::json::object() : parse_json_body(req.body);
    std::cout << "Rendering prompt: " << name << std::endl;
    return create_json_response(get_prompt(name, arguments));
  } catch (const rag_core::StoreError &e) {
    std::cerr << rag_core::format_store_error("get_prompt", e) << std::endl;
    return create_json_response(
        create_error_response(e.what(), rag_core::to_string(e.kind())), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_get_prompt: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 400);
  }
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  // Stored text is UTF-8 checked on ingest; anything else is replaced rather than thrown on
  crow::response resp(status_code,
                      json_data.dump(2, ' ', false, nlohmann::json::error_handler_t::replace));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error, const std::string &kind) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  if (!kind.empty()) {
    response["kind"] = kind;
  }
  return response;
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  try {
    return nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error &e) {
    throw RequestError(std::string("Request body is not valid JSON: ") + e.what());
  }
}

}  // namespace rag_api
