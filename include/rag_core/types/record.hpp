#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace rag_core {

// One stored chunk, aligned by position with the vector index
struct MetadataEntry {
  std::string text;
  std::string source;
  int chunk_index = 0;
  std::string indexed_at;  // "YYYY-MM-DDTHH:MM:SS" (UTC), empty if unknown

  bool operator==(const MetadataEntry &other) const {
    return text == other.text && source == other.source && chunk_index == other.chunk_index &&
           indexed_at == other.indexed_at;
  }
};

struct QueryResult {
  std::string text;
  std::string source;
  int chunk_index = 0;
  float distance = 0.0f;  // squared L2
  std::optional<float> rerank_score;  // set only when a reranker is configured
};

struct DocumentSummary {
  std::string source;
  size_t chunks = 0;
  std::string indexed_at;  // most recent non-empty timestamp among the source's chunks
};

}  // namespace rag_core
