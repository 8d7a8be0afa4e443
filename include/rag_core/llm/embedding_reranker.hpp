#pragma once

#include <memory>
#include <string>
#include <vector>

#include "rag_core/embedder.hpp"
#include "rag_core/reranker.hpp"

namespace rag_core {

// Reranks with a second, usually larger, embedding model: the score is the
// cosine similarity of query and passage mapped onto [0, 1].
class EmbeddingReranker : public Reranker {
 public:
  // Throws ConfigError if embedder is null
  explicit EmbeddingReranker(std::shared_ptr<Embedder> embedder);

  std::vector<float> score(const std::string &query,
                           const std::vector<std::string> &passages) override;

  std::string model_name() const override {
    return embedder_->model_name();
  }

  static float cosine_similarity(const std::vector<float> &a, const std::vector<float> &b);

 private:
  std::shared_ptr<Embedder> embedder_;
};

}  // namespace rag_core
