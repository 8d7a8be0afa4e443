#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace rag_api {

// Unknown prompt name or missing required argument
class PromptError : public std::exception {
 public:
  explicit PromptError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct PromptArgument {
  std::string name;
  std::string description;
  bool required = false;
};

struct PromptDefinition {
  std::string name;
  std::string description;
  std::vector<PromptArgument> arguments;
};

/**
 * @class PromptLibrary
 * @brief Prompt templates that turn retrieved chunks into an instruction for an agent.
 *
 * "extract-answer" asks for an answer to a query drawn only from the chunks;
 * "summarize-documents" asks for a bounded summary of the chunks about a topic.
 * The "chunks" argument is a JSON array of {text, source, distance?} objects or
 * a string holding one. A string that does not parse counts as no chunks.
 */
class PromptLibrary {
 public:
  static const std::vector<PromptDefinition> &definitions();
  static nlohmann::json definitions_json();
  static bool has_prompt(const std::string &name);

  // Throws PromptError for an unknown name or a missing required argument
  static std::string render(const std::string &name, const nlohmann::json &arguments);

  static constexpr int kDefaultSummaryWords = 200;

 private:
  static nlohmann::json parse_chunks(const nlohmann::json &arguments);
  static std::string format_chunks(const nlohmann::json &chunks);
  static std::string required_string(const nlohmann::json &arguments, const std::string &name);
  static std::string max_length_of(const nlohmann::json &arguments);
};

}  // namespace rag_api
