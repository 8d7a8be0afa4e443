#include "rag_api/prompts.hpp"

#include <sstream>

namespace rag_api {

const std::vector<PromptDefinition> &PromptLibrary::definitions() {
  static const std::vector<PromptDefinition> prompts = {
      PromptDefinition{
          .name = "extract-answer",
          .description = "Answer a question using only the retrieved document chunks, citing "
                         "their sources.",
          .arguments = {{"query", "The question to answer", true},
                        {"chunks",
                         "JSON array of retrieved chunks; fetched from the store when omitted",
                         false}}},
      PromptDefinition{
          .name = "summarize-documents",
          .description = "Summarize what the retrieved document chunks say about a topic.",
          .arguments = {{"topic", "The topic to summarize", true},
                        {"chunks",
                         "JSON array of retrieved chunks; fetched from the store when omitted",
                         false},
                        {"max_length", "Maximum summary length in words (default 200)",
                         false}}},
  };
  return prompts;
}

nlohmann::json PromptLibrary::definitions_json() {
  nlohmann::json prompts = nlohmann::json::array();
  for (const auto &definition : definitions()) {
    nlohmann::json arguments = nlohmann::json::array();
    for (const auto &argument : definition.arguments) {
      arguments.push_back({{"name", argument.name},
                           {"description", argument.description},
                           {"required", argument.required}});
    }
    prompts.push_back({{"name", definition.name},
                       {"description", definition.description},
                       {"arguments", arguments}});
  }
  return prompts;
}

bool PromptLibrary::has_prompt(const std::string &name) {
  for (const auto &definition : definitions()) {
    if (definition.name == name) {
      return true;
    }
  }
  return false;
}

std::string PromptLibrary::render(const std::string &name, const nlohmann::json &arguments) {
  if (!has_prompt(name)) {
    throw PromptError("Unknown prompt: " + name);
  }
  nlohmann::json chunks = parse_chunks(arguments);

  std::ostringstream text;
  if (name == "extract-answer") {
    text << "Answer the following question using only the information in the document "
            "excerpts below.\n"
         << "If the excerpts do not contain the answer, say so instead of guessing.\n"
         << "Cite the source of every fact you use.\n\n"
         << "Question: " << required_string(arguments, "query") << "\n\n"
         << "Document excerpts:\n"
         << format_chunks(chunks);
  } else {
    text << "Summarize what the document excerpts below say about the topic \""
         << required_string(arguments, "topic") << "\".\n"
         << "Keep the summary under " << max_length_of(arguments) << " words and mention "
         << "which sources each point comes from.\n\n"
         << "Document excerpts:\n"
         << format_chunks(chunks);
  }
  return text.str();
}

nlohmann::json PromptLibrary::parse_chunks(const nlohmann::json &arguments) {
  if (!arguments.is_object() || !arguments.contains("chunks")) {
    return nlohmann::json::array();
  }
  nlohmann::json chunks = arguments["chunks"];
  if (chunks.is_string()) {
    chunks = nlohmann::json::parse(chunks.get<std::string>(), nullptr, false);
  }
  if (!chunks.is_array()) {
    return nlohmann::json::array();
  }
  return chunks;
}

std::string PromptLibrary::format_chunks(const nlohmann::json &chunks) {
  std::ostringstream out;
  int shown = 0;
  for (const auto &chunk : chunks) {
    if (!chunk.is_object() || !chunk.contains("text") || !chunk["text"].is_string()) {
      continue;
    }
    ++shown;
    std::string source = "unknown";
    if (chunk.contains("source") && chunk["source"].is_string()) {
      source = chunk["source"].get<std::string>();
    }
    out << "\n[" << shown << "] Source: " << source;
    if (chunk.contains("distance") && chunk["distance"].is_number()) {
      out << " (distance: " << chunk["distance"].get<double>() << ")";
    }
    out << "\n" << chunk["text"].get<std::string>() << "\n";
  }
  if (shown == 0) {
    out << "\n(no document excerpts were provided)\n";
  }
  return out.str();
}

std::string PromptLibrary::required_string(const nlohmann::json &arguments,
                                           const std::string &name) {
  if (!arguments.is_object() || !arguments.contains(name) || !arguments[name].is_string()) {
    throw PromptError("Missing required string argument '" + name + "'");
  }
  return arguments[name].get<std::string>();
}

std::string PromptLibrary::max_length_of(const nlohmann::json &arguments) {
  if (!arguments.is_object() || !arguments.contains("max_length") ||
      arguments["max_length"].is_null()) {
    return std::to_string(kDefaultSummaryWords);
  }
  const nlohmann::json &max_length = arguments["max_length"];
  if (max_length.is_number_integer() && max_length.get<long long>() > 0) {
    return std::to_string(max_length.get<long long>());
  }
  if (max_length.is_string()) {
    const std::string value = max_length.get<std::string>();
    if (!value.empty() && value.size() <= 9 &&
        value.find_first_not_of("0123456789") == std::string::npos &&
        value.find_first_not_of('0') != std::string::npos) {
      return std::to_string(std::stoi(value));
    }
  }
  throw PromptError("Argument 'max_length' must be a positive whole number");
}

}  // namespace rag_api
