#pragma once

#include <algorithm>
#include <array>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace rag_api {

class Config {
 public:
  std::string api_base_url;
  std::string ollama_url;
  std::string embedding_model;
  // Second embedding model used to rerank query results; empty disables reranking
  std::string rerank_model;

  // Store location
  std::string index_dir;
  std::string index_file;
  std::string metadata_file;

  // Chunking and query defaults
  int chunk_size_words;
  int chunk_overlap_words;
  int default_top_k;

  // Crow's log level: debug, info, warning, error or critical
  std::string log_level;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw std::runtime_error("Config root must be a JSON object");
    }
    Config config;

    try {
      // Apply defaults when keys are missing
      config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:3030"));
      config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
      config.embedding_model = json_config.value("embedding_model", std::string("all-minilm"));
      config.rerank_model = json_config.value("rerank_model", std::string());

      config.index_dir = json_config.value("index_dir", std::string("."));
      config.index_file = json_config.value("index_file", std::string("faiss.index"));
      config.metadata_file = json_config.value("metadata_file", std::string("metadata.json"));

      config.chunk_size_words = json_config.value("chunk_size_words", 500);
      config.chunk_overlap_words = json_config.value("chunk_overlap_words", 50);
      config.default_top_k = json_config.value("default_top_k", 3);
      config.log_level = json_config.value("log_level", std::string("warning"));
    } catch (const nlohmann::json::type_error& e) {
      throw std::runtime_error(std::string("Config has a value of the wrong type: ") + e.what());
    }

    config.validate();
    return config;
  }

  std::string host() const {
    return api_base_url.substr(0, api_base_url.find(':'));
  }

  int port() const {
    return std::stoi(api_base_url.substr(api_base_url.find(':') + 1));
  }

 private:
  void validate() const {
    if (api_base_url.empty()) {
      throw std::runtime_error("api_base_url cannot be empty");
    }
    const auto colon = api_base_url.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == api_base_url.size() ||
        api_base_url.find_first_not_of("0123456789", colon + 1) != std::string::npos) {
      throw std::runtime_error("api_base_url must have the form host:port");
    }
    const std::string port_digits = api_base_url.substr(colon + 1);
    if (port_digits.size() > 5 || std::stoi(port_digits) < 1 || std::stoi(port_digits) > 65535) {
      throw std::runtime_error("api_base_url port must be between 1 and 65535");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (index_dir.empty()) {
      throw std::runtime_error("index_dir cannot be empty");
    }
    if (index_file.empty()) {
      throw std::runtime_error("index_file cannot be empty");
    }
    if (metadata_file.empty()) {
      throw std::runtime_error("metadata_file cannot be empty");
    }
    if (chunk_size_words <= 0) {
      throw std::runtime_error("chunk_size_words must be greater than 0");
    }
    if (chunk_overlap_words < 0 || chunk_overlap_words >= chunk_size_words) {
      throw std::runtime_error("chunk_overlap_words must be at least 0 and less than chunk_size_words");
    }
    if (default_top_k <= 0) {
      throw std::runtime_error("default_top_k must be greater than 0");
    }
    static const std::array<std::string, 5> kLogLevels = {"debug", "info", "warning", "error",
                                                          "critical"};
    if (std::find(kLogLevels.begin(), kLogLevels.end(), log_level) == kLogLevels.end()) {
      throw std::runtime_error("log_level must be one of debug, info, warning, error, critical");
    }
  }
};

}  // namespace rag_api
