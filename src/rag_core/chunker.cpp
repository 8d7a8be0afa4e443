#include "rag_core/chunker.hpp"

#include <algorithm>
#include <sstream>

#include "rag_core/errors.hpp"

namespace rag_core {

void ChunkingOptions::validate() const {
  if (size_words <= 0) {
    throw ConfigError("chunk size must be greater than 0 words, got " + std::to_string(size_words));
  }
  if (overlap_words < 0) {
    throw ConfigError("chunk overlap cannot be negative, got " + std::to_string(overlap_words));
  }
  if (overlap_words >= size_words) {
    throw ConfigError("chunk overlap (" + std::to_string(overlap_words) +
                      " words) must be smaller than chunk size (" + std::to_string(size_words) +
                      " words)");
  }
}

Chunker::Chunker(ChunkingOptions options) : options_(options) {
  options_.validate();
}

std::vector<std::string> Chunker::split_words(const std::string &text) {
  std::vector<std::string> words;
  std::istringstream stream(text);
  std::string word;
  while (stream >> word) {
    words.push_back(std::move(word));
  }
  return words;
}

std::string Chunker::join_words(const std::vector<std::string> &words, size_t begin, size_t end) {
  std::string out;
  for (size_t i = begin; i < end; ++i) {
    if (i > begin)
      out += ' ';
    out += words[i];
  }
  return out;
}

std::vector<Chunk> Chunker::chunk(const std::string &text, const std::string &source) const {
  const std::vector<std::string> words = split_words(text);
  if (words.empty()) {
    return {};
  }

  const size_t size = static_cast<size_t>(options_.size_words);
  const size_t step = static_cast<size_t>(options_.size_words - options_.overlap_words);

  std::vector<Chunk> chunks;
  int chunk_index = 0;
  for (size_t start = 0; start < words.size(); start += step) {
    size_t end = std::min(words.size(), start + size);
    chunks.push_back({.text = join_words(words, start, end),
                      .source = source,
                      .chunk_index = chunk_index++});
    // The window that reaches the last word is the final one
    if (end == words.size())
      break;
  }
  return chunks;
}

}  // namespace rag_core
