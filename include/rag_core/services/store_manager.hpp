#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "rag_core/chunker.hpp"
#include "rag_core/db/metadata_store.hpp"
#include "rag_core/db/store_persistence.hpp"
#include "rag_core/embedder.hpp"
#include "rag_core/errors.hpp"
#include "rag_core/index/vector_index.hpp"
#include "rag_core/reranker.hpp"
#include "rag_core/types.hpp"

namespace rag_core {

struct StoreSettings {
  int chunk_size_words = 500;
  int chunk_overlap_words = 50;
  int default_top_k = 3;

  ChunkingOptions chunking() const {
    return ChunkingOptions{.size_words = chunk_size_words, .overlap_words = chunk_overlap_words};
  }
};

struct IngestResult {
  bool success = false;
  size_t chunks_added = 0;
  size_t total_documents = 0;
  std::optional<StoreErrorKind> error_kind;
  std::string error_message;

  static IngestResult success_response(size_t chunks_added, size_t total_documents) {
    return IngestResult{.success = true,
                        .chunks_added = chunks_added,
                        .total_documents = total_documents};
  }

  static IngestResult failure_response(StoreErrorKind kind, const std::string &message,
                                       size_t total_documents) {
    return IngestResult{.success = false,
                        .chunks_added = 0,
                        .total_documents = total_documents,
                        .error_kind = kind,
                        .error_message = message};
  }
};

/**
 * @class StoreManager
 * @brief Owns the vector index and metadata store and keeps them aligned.
 *
 * Loads the persisted pair on construction, appends whole documents atomically
 * and answers nearest-neighbour queries. Ingestion and save take the writer
 * lock; queries take the reader lock and may run concurrently. Embedding runs
 * outside any lock.
 */
class StoreManager {
 public:
  /**
   * @throws CorruptStoreError / IOFailureError if the persisted files cannot be loaded.
   * @throws DimensionMismatchError if a non-empty persisted index disagrees with
   *         embedder->embed_dimension().
   * @throws ConfigError if the settings are invalid.
   *
   * With a reranker, queries fetch extra candidates by distance and return the
   * top_k best by rerank score, each result carrying its rerank_score.
   */
  StoreManager(std::shared_ptr<Embedder> embedder, StorePaths paths, StoreSettings settings = {},
               std::shared_ptr<Reranker> reranker = nullptr);

  // Disable copy constructor and assignment
  StoreManager(const StoreManager &) = delete;
  StoreManager &operator=(const StoreManager &) = delete;

  /**
   * @brief Chunks, embeds, appends and persists a document.
   *
   * Either every chunk of the document is stored or none is. Failures are
   * returned in the result rather than thrown; text that is not UTF-8 is
   * reported as InvalidDocument.
   */
  IngestResult ingest(const std::string &document, const std::string &source = "unknown");
  IngestResult ingest(const std::string &document, const std::string &source,
                      const ChunkingOptions &chunking);

  // Nearest chunks by ascending squared L2 distance. Throws ConfigError if top_k <= 0.
  std::vector<QueryResult> query(const std::string &query_text);
  std::vector<QueryResult> query(const std::string &query_text, int top_k);

  // Writes the current state to disk. Throws IOFailureError.
  void save();

  std::vector<DocumentSummary> list_documents() const;
  size_t size() const;
  int dimension() const;
  std::string model_name() const;
  // Empty when queries are not reranked
  std::string reranker_name() const;

  const StoreSettings &settings() const {
    return settings_;
  }
  const StorePaths &paths() const {
    return paths_;
  }

 private:
  std::shared_ptr<Embedder> embedder_;
  std::shared_ptr<Reranker> reranker_;
  StorePaths paths_;
  StoreSettings settings_;

  mutable std::shared_mutex mutex_;
  VectorIndex index_;
  MetadataStore metadata_;

  void check_loaded_dimension();
  std::vector<std::vector<float>> embed_chunks(const std::vector<Chunk> &chunks) const;
  void rerank(const std::string &query_text, std::vector<QueryResult> &results) const;
  size_t append_batch(const std::vector<Chunk> &chunks,
                      const std::vector<std::vector<float>> &vectors);
};

// Current UTC time as "YYYY-MM-DDTHH:MM:SS"
std::string current_timestamp();

}  // namespace rag_core
