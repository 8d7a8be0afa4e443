#pragma once

#include <optional>
#include <string>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace rag_cli
{

  enum class Command
  {
    Ingest,
    Query,
    List,
    Tools,
    Prompts,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string file_path;
    std::string source;
    std::string query;
    std::optional<int> top_k;  // server default when unset
    bool json_output = false;

    // prompts: list when prompt_name is empty, otherwise render that prompt
    std::string prompt_name;
    std::string topic;
    std::optional<int> max_length;
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

    // Disable copy constructor and assignment
    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Allow move constructor and assignment
    CliHandler(CliHandler &&) noexcept;
    CliHandler &operator=(CliHandler &&) noexcept;

    // Parse command line arguments. Throws CliError on unknown commands or missing flags.
    static CliOptions parse_arguments(int argc, char *argv[]);

    // Execute command
    void execute_command(const CliOptions &options);

    void set_api_base_url(const std::string &url);
    std::string get_api_base_url() const;

    // Output formatting, kept separate from the HTTP calls
    static std::string format_ingest_response(const nlohmann::json &response, const std::string &source);
    static std::string format_query_response(const nlohmann::json &response);
    static std::string format_document_list(const nlohmann::json &response);
    static std::string format_tools(const nlohmann::json &response);
    static std::string format_prompts(const nlohmann::json &response);
    static std::string format_prompt_messages(const nlohmann::json &response);

    // Request body for POST /prompts/<name>
    static nlohmann::json build_prompt_arguments(const CliOptions &options);

    // "message (kind)" from an error body, empty if the body carries no readable error
    static std::string describe_error_body(const nlohmann::json &body);

    // First max_chars code points of UTF-8 text, never splitting a sequence
    static std::string preview_text(const std::string &text, size_t max_chars = 200);

    // "2024-12-08T14:23:00" -> "2024-12-08 14:23"; anything unparsable is returned as is
    static std::string format_indexed_at(const std::string &indexed_at);

    static std::string read_file_contents(const std::string &file_path);

  private:
    std::string api_base_url_;
    CURL *curl_handle_;

    // Command handlers
    void handle_ingest_command(const CliOptions &options);
    void handle_query_command(const CliOptions &options);
    void handle_list_command(const CliOptions &options);
    void handle_tools_command(const CliOptions &options);
    void handle_prompts_command(const CliOptions &options);
    void handle_help_command(const CliOptions &options);

    // HTTP methods
    nlohmann::json make_get_request(const std::string &endpoint);
    nlohmann::json make_post_request(const std::string &endpoint, const nlohmann::json &data);
    nlohmann::json perform_request(const std::string &endpoint);

    // Helper methods
    void setup_curl_handle();
    static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
    void print_help();
    std::string build_url(const std::string &endpoint);
  };

}
