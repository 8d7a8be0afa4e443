#include "rag_core/llm/ollama_embedder.hpp"

#include <ollama.hpp>

namespace rag_core {

OllamaEmbedder::OllamaEmbedder(const std::string &ollama_url, const std::string &embedding_model)
    : ollama_url_(ollama_url), embedding_model_(embedding_model) {
  setup_server_connection();
  detect_dimension();
}

void OllamaEmbedder::setup_server_connection() {
  ollama::setServerURL(ollama_url_);
  if (!ollama::is_running()) {
    throw OllamaError("Ollama server is not running at " + ollama_url_);
  }
}

// The model decides the dimension; embed a throwaway string once to find it
void OllamaEmbedder::detect_dimension() {
  std::vector<float> sample = embed("test");
  if (sample.empty()) {
    throw OllamaError("Model " + embedding_model_ + " returned an empty embedding");
  }
  dimension_ = static_cast<int>(sample.size());
}

std::vector<float> OllamaEmbedder::embed(const std::string &text) {
  try {
    ollama::response response = ollama::generate_embeddings(embedding_model_, text);

    auto json_response = response.as_json();

    if (!json_response.contains("embeddings")) {
      throw OllamaError("Response does not contain embeddings field");
    }

    // Handle different embedding response formats
    auto embeddings = json_response["embeddings"];
    if (!embeddings.is_array()) {
      throw OllamaError("Embeddings field is not an array");
    }
    if (embeddings.size() > 0 && embeddings[0].is_array()) {
      // Array of arrays - one input, take the first embedding vector
      return embeddings[0].get<std::vector<float>>();
    }
    return embeddings.get<std::vector<float>>();

  } catch (const ollama::exception &e) {
    throw OllamaError("Embedding generation failed: " + std::string(e.what()));
  }
}

bool OllamaEmbedder::is_server_available() {
  return ollama::is_running();
}

}  // namespace rag_core
