#include "rag_cli/cli_handler.hpp"
#include <utf8.h>

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iomanip> // Required for std::fixed and std::setprecision
#include <memory>
#include <sstream>

namespace rag_cli {

CliHandler::CliHandler(const std::string& api_base_url)
    : api_base_url_(api_base_url), curl_handle_(nullptr) {
    setup_curl_handle();
}

CliHandler::~CliHandler() {
    if (curl_handle_) {
        curl_easy_cleanup(curl_handle_);
    }
}

CliHandler::CliHandler(CliHandler&& other) noexcept
    : api_base_url_(std::move(other.api_base_url_))
    , curl_handle_(other.curl_handle_) {
    other.curl_handle_ = nullptr;
}

CliHandler& CliHandler::operator=(CliHandler&& other) noexcept {
    if (this != &other) {
        if (curl_handle_) {
            curl_easy_cleanup(curl_handle_);
        }
        api_base_url_ = std::move(other.api_base_url_);
        curl_handle_ = other.curl_handle_;
        other.curl_handle_ = nullptr;
    }
    return *this;
}

void CliHandler::setup_curl_handle() {
    curl_handle_ = curl_easy_init();
    if (!curl_handle_) {
        throw CliError("Failed to initialize CURL");
    }
}

size_t CliHandler::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append((char*)contents, size * nmemb);
    return size * nmemb;
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];

    // Returns the value following a flag, or throws if there is none
    auto flag_value = [&](int& i, const std::string& flag) {
        if (i + 1 >= argc) {
            throw CliError("Flag " + flag + " requires a value");
        }
        return std::string(argv[++i]);
    };

    auto positive_value = [&](int& i, const std::string& flag) {
        std::string value = flag_value(i, flag);
        int number = 0;
        try {
            number = std::stoi(value);
        } catch (const std::exception&) {
            throw CliError("Invalid value for " + flag + ": " + value);
        }
        if (number <= 0) {
            throw CliError(flag + " must be greater than 0");
        }
        return number;
    };

    if (command == "ingest" || command == "i") {
        options.command = Command::Ingest;
        for (int i = 2; i < argc; ++i) {
            std::string flag = argv[i];
            if (flag == "--file" || flag == "-f") {
                options.file_path = flag_value(i, flag);
            } else if (flag == "--source" || flag == "-s") {
                options.source = flag_value(i, flag);
            } else {
                throw CliError("Unknown flag for ingest: " + flag);
            }
        }
        if (options.file_path.empty()) {
            throw CliError("Ingest command requires a file path. Usage: ingest --file <path> [--source <name>]");
        }
        if (options.source.empty()) {
            options.source = std::filesystem::path(options.file_path).filename().string();
        }
    } else if (command == "query" || command == "q") {
        options.command = Command::Query;
        for (int i = 2; i < argc; ++i) {
            std::string flag = argv[i];
            if (flag == "--query" || flag == "-q") {
                options.query = flag_value(i, flag);
            } else if (flag == "--top-k" || flag == "-k") {
                options.top_k = positive_value(i, "--top-k");
            } else {
                throw CliError("Unknown flag for query: " + flag);
            }
        }
        if (options.query.empty()) {
            throw CliError("Query command requires a query. Usage: query --query <text> [--top-k <n>]");
        }
    } else if (command == "list" || command == "l") {
        options.command = Command::List;
        for (int i = 2; i < argc; ++i) {
            std::string flag = argv[i];
            if (flag == "--json") {
                options.json_output = true;
            } else {
                throw CliError("Unknown flag for list: " + flag);
            }
        }
    } else if (command == "tools" || command == "t") {
        options.command = Command::Tools;
    } else if (command == "prompts" || command == "p") {
        options.command = Command::Prompts;
        for (int i = 2; i < argc; ++i) {
            std::string flag = argv[i];
            if (flag == "--name" || flag == "-n") {
                options.prompt_name = flag_value(i, flag);
            } else if (flag == "--query" || flag == "-q") {
                options.query = flag_value(i, flag);
            } else if (flag == "--topic") {
                options.topic = flag_value(i, flag);
            } else if (flag == "--max-length") {
                options.max_length = positive_value(i, "--max-length");
            } else if (flag == "--top-k" || flag == "-k") {
                options.top_k = positive_value(i, "--top-k");
            } else {
                throw CliError("Unknown flag for prompts: " + flag);
            }
        }
        if (options.prompt_name.empty() && (!options.query.empty() || !options.topic.empty())) {
            throw CliError("Rendering a prompt requires --name. Usage: prompts [--name <prompt> --query <text> | --topic <text>]");
        }
        if (!options.prompt_name.empty() && options.query.empty() && options.topic.empty()) {
            throw CliError("Prompt " + options.prompt_name + " needs --query or --topic");
        }
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
    } else {
        throw CliError("Unknown command: " + command);
    }

    return options;
}

void CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Ingest:
            handle_ingest_command(options);
            break;
        case Command::Query:
            handle_query_command(options);
            break;
        case Command::List:
            handle_list_command(options);
            break;
        case Command::Tools:
            handle_tools_command(options);
            break;
        case Command::Prompts:
            handle_prompts_command(options);
            break;
        case Command::Help:
            handle_help_command(options);
            break;
    }
}

void CliHandler::handle_ingest_command(const CliOptions& options) {
    std::string document = read_file_contents(options.file_path);

    nlohmann::json request_data = {
        {"document", document},
        {"source", options.source}
    };

    nlohmann::json response = make_post_request("/ingest_document", request_data);
    std::cout << format_ingest_response(response, options.source) << std::endl;
}

void CliHandler::handle_query_command(const CliOptions& options) {
    nlohmann::json request_data = {
        {"query", options.query}
    };
    if (options.top_k.has_value()) {
        request_data["top_k"] = *options.top_k;
    }

    nlohmann::json response = make_post_request("/query_rag_store", request_data);
    std::cout << format_query_response(response);
}

void CliHandler::handle_list_command(const CliOptions& options) {
    nlohmann::json response = make_get_request("/documents");
    if (options.json_output) {
        nlohmann::json output = {
            {"documents", response.value("documents", nlohmann::json::array())},
            {"total", response.value("total", 0)}
        };
        std::cout << output.dump(2) << std::endl;
        return;
    }
    std::cout << format_document_list(response);
}

void CliHandler::handle_tools_command(const CliOptions& options) {
    nlohmann::json response = make_get_request("/tools");
    std::cout << format_tools(response);
}

void CliHandler::handle_prompts_command(const CliOptions& options) {
    if (options.prompt_name.empty()) {
        std::cout << format_prompts(make_get_request("/prompts"));
        return;
    }
    nlohmann::json response =
        make_post_request("/prompts/" + options.prompt_name, build_prompt_arguments(options));
    std::cout << format_prompt_messages(response);
}

void CliHandler::handle_help_command(const CliOptions& options) {
    print_help();
}

std::string CliHandler::format_ingest_response(const nlohmann::json& response, const std::string& source) {
    std::ostringstream out;
    out << "Successfully ingested document from '" << source << "'.\n";
    out << "Created " << response.value("chunks_added", 0) << " chunks.\n";
    out << "Total documents in store: " << response.value("total_documents", 0);
    return out.str();
}

std::string CliHandler::format_query_response(const nlohmann::json& response) {
    const nlohmann::json results = response.value("results", nlohmann::json::array());
    if (results.empty()) {
        return "No results found. The vector store may be empty.\n";
    }

    std::ostringstream out;
    out << "Found " << results.size() << " relevant chunks:\n\n";
    int i = 1;
    for (const auto& result : results) {
        std::string text = result.value("text", "");
        out << i++ << ". Source: " << result.value("source", "unknown") << "\n";
        out << "   Distance: " << std::fixed << std::setprecision(4)
            << result.value("distance", 0.0) << "\n";
        if (result.contains("rerank_score") && result["rerank_score"].is_number()) {
            out << "   Rerank score: " << std::fixed << std::setprecision(4)
                << result["rerank_score"].get<double>() << "\n";
        }
        out << "   Text: " << preview_text(text) << "...\n\n";
    }
    return out.str();
}

std::string CliHandler::preview_text(const std::string& text, size_t max_chars) {
    auto it = text.begin();
    try {
        for (size_t count = 0; count < max_chars && it != text.end(); ++count) {
            utf8::next(it, text.end());
        }
    } catch (const utf8::exception&) {
        // Invalid UTF-8: fall back to a byte cut
        return text.substr(0, max_chars);
    }
    return std::string(text.begin(), it);
}

std::string CliHandler::format_prompts(const nlohmann::json& response) {
    const nlohmann::json prompts = response.value("prompts", nlohmann::json::array());
    std::ostringstream out;
    out << "Available prompts:\n\n";
    for (const auto& prompt : prompts) {
        out << "  " << prompt.value("name", "") << "\n";
        out << "    " << prompt.value("description", "") << "\n";
        for (const auto& argument : prompt.value("arguments", nlohmann::json::array())) {
            out << "    - " << argument.value("name", "")
                << (argument.value("required", false) ? " (required)" : "") << ": "
                << argument.value("description", "") << "\n";
        }
        out << "\n";
    }
    return out.str();
}

std::string CliHandler::format_prompt_messages(const nlohmann::json& response) {
    std::ostringstream out;
    for (const auto& message : response.value("messages", nlohmann::json::array())) {
        const nlohmann::json content = message.value("content", nlohmann::json::object());
        out << content.value("text", "") << "\n";
    }
    return out.str();
}

nlohmann::json CliHandler::build_prompt_arguments(const CliOptions& options) {
    nlohmann::json arguments = nlohmann::json::object();
    if (!options.query.empty()) {
        arguments["query"] = options.query;
    }
    if (!options.topic.empty()) {
        arguments["topic"] = options.topic;
    }
    if (options.max_length.has_value()) {
        arguments["max_length"] = *options.max_length;
    }
    if (options.top_k.has_value()) {
        arguments["top_k"] = *options.top_k;
    }
    return arguments;
}

std::string CliHandler::describe_error_body(const nlohmann::json& body) {
    if (body.is_discarded() || !body.is_object() || !body.contains("error") ||
        !body["error"].is_string()) {
        return std::string();
    }
    std::string message = body["error"].get<std::string>();
    if (body.contains("kind") && body["kind"].is_string()) {
        message += " (" + body["kind"].get<std::string>() + ")";
    }
    return message;
}

std::string CliHandler::format_indexed_at(const std::string& indexed_at) {
    std::tm tm_struct = {};
    std::istringstream in(indexed_at);
    in >> std::get_time(&tm_struct, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return indexed_at;
    }
    std::ostringstream out;
    out << std::put_time(&tm_struct, "%Y-%m-%d %H:%M");
    return out.str();
}

std::string CliHandler::format_document_list(const nlohmann::json& response) {
    const nlohmann::json documents = response.value("documents", nlohmann::json::array());
    if (documents.empty()) {
        return "No documents indexed yet.\n";
    }

    std::ostringstream out;
    out << "Indexed Documents (" << response.value("total", documents.size()) << " total)\n\n";
    for (const auto& document : documents) {
        out << "  " << document.value("source", "unknown") << "\n";
        out << "    Chunks: " << document.value("chunks", 0) << "\n";
        std::string indexed_at = document.value("indexed_at", "");
        if (!indexed_at.empty()) {
            out << "    Indexed: " << format_indexed_at(indexed_at) << "\n";
        }
        out << "\n";
    }
    return out.str();
}

std::string CliHandler::format_tools(const nlohmann::json& response) {
    const nlohmann::json tools = response.value("tools", nlohmann::json::array());
    std::ostringstream out;
    out << "Available tools:\n\n";
    for (const auto& tool : tools) {
        out << "  " << tool.value("name", "") << "\n";
        out << "    " << tool.value("description", "") << "\n";

        const nlohmann::json schema = tool.value("input_schema", nlohmann::json::object());
        const nlohmann::json required = schema.value("required", nlohmann::json::array());
        const nlohmann::json properties = schema.value("properties", nlohmann::json::object());
        for (const auto& [name, property] : properties.items()) {
            bool is_required = std::find(required.begin(), required.end(), name) != required.end();
            out << "    - " << name << " (" << property.value("type", "any")
                << (is_required ? ", required" : "") << ")\n";
        }
        out << "\n";
    }
    return out.str();
}

std::string CliHandler::read_file_contents(const std::string& file_path) {
    std::ifstream file(file_path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        throw CliError("Cannot open file: " + file_path);
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

nlohmann::json CliHandler::perform_request(const std::string& endpoint) {
    std::string response_buffer;
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);

    CURLcode res = curl_easy_perform(curl_handle_);
    if (res != CURLE_OK) {
        throw CliError("CURL request failed: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);

    nlohmann::json body = nlohmann::json::parse(response_buffer, nullptr, false);
    if (http_code != 200) {
        std::string message = describe_error_body(body);
        if (!message.empty()) {
            throw CliError(endpoint + " failed: " + message);
        }
        throw CliError("HTTP request failed with status code: " + std::to_string(http_code));
    }
    if (body.is_discarded()) {
        throw CliError("Server returned invalid JSON from " + endpoint);
    }
    return body;
}

nlohmann::json CliHandler::make_get_request(const std::string& endpoint) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    std::string url = build_url(endpoint);

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());

    return perform_request(endpoint);
}

nlohmann::json CliHandler::make_post_request(const std::string& endpoint, const nlohmann::json& data) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    std::string url = build_url(endpoint);
    std::string request_json = data.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(
        curl_slist_append(nullptr, "Content-Type: application/json"), &curl_slist_free_all);
    if (!headers) {
        throw CliError("Failed to allocate request headers");
    }

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, request_json.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers.get());

    return perform_request(endpoint);
}

void CliHandler::print_help() {
    std::cout << "RAG Store CLI\n\n"
              << "Usage: rag_cli <command> [options]\n\n"
              << "Commands:\n"
              << "  ingest, i    Ingest a text file\n"
              << "               --file, -f <path>     File to ingest (required)\n"
              << "               --source, -s <name>   Source name (default: file name)\n"
              << "  query, q     Find the chunks closest to a query\n"
              << "               --query, -q <text>    Query text (required)\n"
              << "               --top-k, -k <n>       Number of results (default: server setting)\n"
              << "  list, l      List indexed documents\n"
              << "               --json                Print JSON instead of text\n"
              << "  tools, t     Show the tools the server exposes\n"
              << "  prompts, p   List prompts, or render one with --name\n"
              << "               --name, -n <prompt>   extract-answer or summarize-documents\n"
              << "               --query, -q <text>    Question for extract-answer\n"
              << "               --topic <text>        Topic for summarize-documents\n"
              << "               --max-length <words>  Summary length (default: 200)\n"
              << "               --top-k, -k <n>       Chunks to retrieve (default: server setting)\n"
              << "  help, h      Show this help\n\n"
              << "Environment:\n"
              << "  API_BASE_URL  Server address (default: http://127.0.0.1:3030)\n";
}

void CliHandler::set_api_base_url(const std::string& url) {
    api_base_url_ = url;
}

std::string CliHandler::get_api_base_url() const {
    return api_base_url_;
}

std::string CliHandler::build_url(const std::string& endpoint) {
    return api_base_url_ + endpoint;
}

} // namespace rag_cli
