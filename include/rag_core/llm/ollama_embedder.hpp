#pragma once

#include <exception>
#include <string>
#include <vector>

#include "rag_core/embedder.hpp"

namespace rag_core {

class OllamaError : public std::exception {
 public:
  explicit OllamaError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class OllamaEmbedder : public Embedder {
 public:
  // Connects to the server and embeds a sample once to learn the model dimension
  OllamaEmbedder(const std::string &ollama_url, const std::string &embedding_model);
  ~OllamaEmbedder() override = default;

  // Disable copy constructor and assignment
  OllamaEmbedder(const OllamaEmbedder &) = delete;
  OllamaEmbedder &operator=(const OllamaEmbedder &) = delete;

  std::vector<float> embed(const std::string &text) override;

  int embed_dimension() const override {
    return dimension_;
  }

  std::string model_name() const override {
    return embedding_model_;
  }

  bool is_server_available();

 private:
  std::string ollama_url_;
  std::string embedding_model_;
  int dimension_ = 0;

  // Helper methods
  void setup_server_connection();
  void detect_dimension();
};

}  // namespace rag_core
