#pragma once

#include <exception>
#include <string>

namespace rag_core {

enum class StoreErrorKind {
  Config,
  DimensionMismatch,
  OutOfRange,
  CorruptStore,
  IOFailure,
  EmbeddingFailure,
  InvalidDocument
};

inline std::string to_string(StoreErrorKind kind) {
  switch (kind) {
    case StoreErrorKind::Config:
      return "config_error";
    case StoreErrorKind::DimensionMismatch:
      return "dimension_mismatch";
    case StoreErrorKind::OutOfRange:
      return "out_of_range";
    case StoreErrorKind::CorruptStore:
      return "corrupt_store";
    case StoreErrorKind::IOFailure:
      return "io_failure";
    case StoreErrorKind::EmbeddingFailure:
      return "embedding_failure";
    case StoreErrorKind::InvalidDocument:
      return "invalid_document";
    default:
      return "unknown";
  }
}

class StoreError : public std::exception {
 public:
  StoreError(StoreErrorKind kind, const std::string &message) : kind_(kind), message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

  StoreErrorKind kind() const noexcept {
    return kind_;
  }

 private:
  StoreErrorKind kind_;
  std::string message_;
};

// Invalid chunking or query parameters
class ConfigError : public StoreError {
 public:
  explicit ConfigError(const std::string &message)
      : StoreError(StoreErrorKind::Config, message) {}
};

// Vector length disagrees with the index dimension
class DimensionMismatchError : public StoreError {
 public:
  explicit DimensionMismatchError(const std::string &message)
      : StoreError(StoreErrorKind::DimensionMismatch, message) {}
};

class OutOfRangeError : public StoreError {
 public:
  explicit OutOfRangeError(const std::string &message)
      : StoreError(StoreErrorKind::OutOfRange, message) {}
};

// Persisted files are missing or mismatched so that index and metadata no longer line up
class CorruptStoreError : public StoreError {
 public:
  explicit CorruptStoreError(const std::string &message)
      : StoreError(StoreErrorKind::CorruptStore, message) {}
};

class IOFailureError : public StoreError {
 public:
  explicit IOFailureError(const std::string &message)
      : StoreError(StoreErrorKind::IOFailure, message) {}
};

// Embedder or reranker returned something unusable
class EmbeddingFailureError : public StoreError {
 public:
  explicit EmbeddingFailureError(const std::string &message)
      : StoreError(StoreErrorKind::EmbeddingFailure, message) {}
};

// Document text that cannot be stored, e.g. bytes that are not UTF-8
class InvalidDocumentError : public StoreError {
 public:
  explicit InvalidDocumentError(const std::string &message)
      : StoreError(StoreErrorKind::InvalidDocument, message) {}
};

inline std::string format_store_error(const std::string &operation, const StoreError &e) {
  return operation + " failed: (" + to_string(e.kind()) + ") " + e.what();
}

}  // namespace rag_core
