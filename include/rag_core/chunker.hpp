#pragma once

#include <string>
#include <vector>

#include "rag_core/types/chunk.hpp"

namespace rag_core {

struct ChunkingOptions {
  int size_words = 500;
  int overlap_words = 50;

  // Throws ConfigError unless size_words > overlap_words >= 0
  void validate() const;
};

class Chunker {
 public:
  explicit Chunker(ChunkingOptions options = {});

  /**
   * @brief Splits text into overlapping windows of whitespace-separated words.
   *
   * Each window holds up to size_words words and starts size_words - overlap_words
   * words after the previous one. The final window may be shorter and is always
   * emitted. Words inside a chunk are joined with a single space.
   *
   * @param text The raw document text.
   * @param source Source identifier copied onto every chunk.
   * @return The chunks in order, chunk_index counting from 0. Empty for blank text.
   */
  std::vector<Chunk> chunk(const std::string &text, const std::string &source = "unknown") const;

  const ChunkingOptions &options() const {
    return options_;
  }

  static std::vector<std::string> split_words(const std::string &text);

 private:
  ChunkingOptions options_;

  static std::string join_words(const std::vector<std::string> &words, size_t begin, size_t end);
};

}  // namespace rag_core
