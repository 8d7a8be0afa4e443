#include "rag_core/llm/embedding_reranker.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "rag_core/errors.hpp"

namespace rag_core {

EmbeddingReranker::EmbeddingReranker(std::shared_ptr<Embedder> embedder)
    : embedder_(std::move(embedder)) {
  if (!embedder_) {
    throw ConfigError("EmbeddingReranker requires an embedder");
  }
}

float EmbeddingReranker::cosine_similarity(const std::vector<float> &a,
                                           const std::vector<float> &b) {
  if (a.size() != b.size()) {
    throw DimensionMismatchError("Cannot compare vectors of dimension " +
                                 std::to_string(a.size()) + " and " + std::to_string(b.size()));
  }
  double dot = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;
  for (size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * b[i];
    norm_a += static_cast<double>(a[i]) * a[i];
    norm_b += static_cast<double>(b[i]) * b[i];
  }
  if (norm_a == 0.0 || norm_b == 0.0) {
    return 0.0f;
  }
  return static_cast<float>(dot / (std::sqrt(norm_a) * std::sqrt(norm_b)));
}

std::vector<float> EmbeddingReranker::score(const std::string &query,
                                            const std::vector<std::string> &passages) {
  if (passages.empty()) {
    return {};
  }
  const std::vector<float> query_vector = embedder_->embed(query);

  std::vector<float> scores;
  scores.reserve(passages.size());
  for (const auto &passage : passages) {
    float similarity = cosine_similarity(query_vector, embedder_->embed(passage));
    scores.push_back(std::clamp((similarity + 1.0f) / 2.0f, 0.0f, 1.0f));
  }
  return scores;
}

}  // namespace rag_core
