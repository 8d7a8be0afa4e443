#include "rag_core/services/store_manager.hpp"

#include <utf8.h>

#include <algorithm>
#include <chrono>
#include <climits>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace rag_core {

namespace {

// Candidates fetched per requested result when a reranker reorders them
constexpr long long kRerankCandidateFactor = 4;

}  // namespace

std::string current_timestamp() {
  auto time_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::stringstream ss;
  ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%dT%H:%M:%S");
  return ss.str();
}

StoreManager::StoreManager(std::shared_ptr<Embedder> embedder, StorePaths paths,
                           StoreSettings settings, std::shared_ptr<Reranker> reranker)
    : embedder_(std::move(embedder)),
      reranker_(std::move(reranker)),
      paths_(std::move(paths)),
      settings_(settings) {
  if (!embedder_) {
    throw ConfigError("StoreManager requires an embedder");
  }
  settings_.chunking().validate();
  if (settings_.default_top_k <= 0) {
    throw ConfigError("default_top_k must be positive, got " +
                      std::to_string(settings_.default_top_k));
  }

  LoadedStore loaded = StorePersistence::load(paths_, embedder_->embed_dimension());
  index_ = std::move(loaded.index);
  metadata_ = std::move(loaded.metadata);
  check_loaded_dimension();

  if (metadata_.model().empty()) {
    metadata_.set_model(embedder_->model_name());
  } else if (metadata_.model() != embedder_->model_name()) {
    std::cerr << "Warning: store was built with model '" << metadata_.model()
              << "' but embedder uses '" << embedder_->model_name() << "'" << std::endl;
  }

  std::cout << "Loaded vector store with " << index_.length() << " chunks (dimension "
            << index_.dimension() << ")" << std::endl;
  if (reranker_) {
    std::cout << "Reranking query results with " << reranker_->model_name() << std::endl;
  }
}

void StoreManager::check_loaded_dimension() {
  const int expected = embedder_->embed_dimension();
  if (index_.length() > 0) {
    if (index_.dimension() != expected) {
      throw DimensionMismatchError("Stored index has dimension " +
                                   std::to_string(index_.dimension()) +
                                   " but the embedder produces dimension " +
                                   std::to_string(expected));
    }
    return;
  }
  // Nothing stored yet; let the embedder decide
  if (index_.dimension() != expected && expected > 0) {
    index_ = VectorIndex(expected);
  }
}

std::vector<std::vector<float>> StoreManager::embed_chunks(const std::vector<Chunk> &chunks) const {
  int expected = dimension();
  if (expected == 0) {
    expected = embedder_->embed_dimension();
  }

  std::vector<std::vector<float>> vectors;
  vectors.reserve(chunks.size());
  for (const auto &chunk : chunks) {
    std::vector<float> vector;
    try {
      vector = embedder_->embed(chunk.text);
    } catch (const StoreError &) {
      throw;
    } catch (const std::exception &e) {
      throw EmbeddingFailureError(e.what());
    }
    if (expected == 0) {
      expected = static_cast<int>(vector.size());
    }
    if (vector.empty() || vector.size() != static_cast<size_t>(expected)) {
      throw DimensionMismatchError("Embedding for chunk " + std::to_string(chunk.chunk_index) +
                                   " of '" + chunk.source + "' has dimension " +
                                   std::to_string(vector.size()) + ", expected " +
                                   std::to_string(expected));
    }
    vectors.push_back(std::move(vector));
  }
  return vectors;
}

size_t StoreManager::append_batch(const std::vector<Chunk> &chunks,
                                  const std::vector<std::vector<float>> &vectors) {
  std::unique_lock lock(mutex_);
  const size_t prior_length = index_.length();
  const std::string indexed_at = current_timestamp();

  try {
    for (size_t i = 0; i < chunks.size(); ++i) {
      index_.append(vectors[i]);
      metadata_.append(MetadataEntry{.text = chunks[i].text,
                                     .source = chunks[i].source,
                                     .chunk_index = chunks[i].chunk_index,
                                     .indexed_at = indexed_at});
    }
    StorePersistence::save(paths_, index_, metadata_);
  } catch (...) {
    // Whatever failed, memory must not run ahead of the files
    index_.truncate(prior_length);
    metadata_.truncate(prior_length);
    throw;
  }
  return index_.length();
}

IngestResult StoreManager::ingest(const std::string &document, const std::string &source) {
  return ingest(document, source, settings_.chunking());
}

IngestResult StoreManager::ingest(const std::string &document, const std::string &source,
                                  const ChunkingOptions &chunking) {
  const std::string effective_source = source.empty() ? "unknown" : source;

  try {
    if (!utf8::is_valid(effective_source.begin(), effective_source.end())) {
      throw InvalidDocumentError("Document source name is not valid UTF-8");
    }
    if (!utf8::is_valid(document.begin(), document.end())) {
      throw InvalidDocumentError("Document from '" + effective_source + "' is not valid UTF-8");
    }
    Chunker chunker(chunking);
    std::vector<Chunk> chunks = chunker.chunk(document, effective_source);
    if (chunks.empty()) {
      return IngestResult::success_response(0, size());
    }

    std::vector<std::vector<float>> vectors = embed_chunks(chunks);
    const size_t total = append_batch(chunks, vectors);

    std::cout << "Ingested " << chunks.size() << " chunks from '" << effective_source
              << "' (" << total << " total)" << std::endl;
    return IngestResult::success_response(chunks.size(), total);
  } catch (const StoreError &e) {
    std::cerr << format_store_error("ingest '" + effective_source + "'", e) << std::endl;
    return IngestResult::failure_response(e.kind(), e.what(), size());
  }
}

std::vector<QueryResult> StoreManager::query(const std::string &query_text) {
  return query(query_text, settings_.default_top_k);
}

std::vector<QueryResult> StoreManager::query(const std::string &query_text, int top_k) {
  if (top_k <= 0) {
    throw ConfigError("top_k must be positive, got " + std::to_string(top_k));
  }
  if (size() == 0) {
    return {};
  }

  std::vector<float> query_vector = embedder_->embed(query_text);
  const int candidates =
      reranker_ ? static_cast<int>(std::min<long long>(top_k * kRerankCandidateFactor, INT_MAX))
                : top_k;

  std::vector<QueryResult> results;
  {
    std::shared_lock lock(mutex_);
    std::vector<Neighbor> neighbors = index_.search(query_vector, candidates);
    results.reserve(neighbors.size());
    for (const auto &neighbor : neighbors) {
      const MetadataEntry &entry = metadata_.get(neighbor.position);
      results.push_back(QueryResult{.text = entry.text,
                                    .source = entry.source,
                                    .chunk_index = entry.chunk_index,
                                    .distance = neighbor.distance});
    }
  }

  if (reranker_ && !results.empty()) {
    rerank(query_text, results);
  }
  if (results.size() > static_cast<size_t>(top_k)) {
    results.resize(static_cast<size_t>(top_k));
  }
  return results;
}

void StoreManager::rerank(const std::string &query_text, std::vector<QueryResult> &results) const {
  std::vector<std::string> passages;
  passages.reserve(results.size());
  for (const auto &result : results) {
    passages.push_back(result.text);
  }

  std::vector<float> scores = reranker_->score(query_text, passages);
  if (scores.size() != results.size()) {
    throw EmbeddingFailureError("Reranker " + reranker_->model_name() + " returned " +
                                std::to_string(scores.size()) + " scores for " +
                                std::to_string(results.size()) + " passages");
  }
  for (size_t i = 0; i < results.size(); ++i) {
    results[i].rerank_score = scores[i];
  }
  // Equal scores keep their distance order
  std::stable_sort(results.begin(), results.end(), [](const QueryResult &a, const QueryResult &b) {
    return *a.rerank_score > *b.rerank_score;
  });
}

void StoreManager::save() {
  std::unique_lock lock(mutex_);
  StorePersistence::save(paths_, index_, metadata_);
}

std::vector<DocumentSummary> StoreManager::list_documents() const {
  std::shared_lock lock(mutex_);
  return metadata_.summarize_sources();
}

size_t StoreManager::size() const {
  std::shared_lock lock(mutex_);
  return index_.length();
}

int StoreManager::dimension() const {
  std::shared_lock lock(mutex_);
  return index_.dimension();
}

std::string StoreManager::model_name() const {
  return embedder_->model_name();
}

std::string StoreManager::reranker_name() const {
  return reranker_ ? reranker_->model_name() : std::string();
}

}  // namespace rag_core
