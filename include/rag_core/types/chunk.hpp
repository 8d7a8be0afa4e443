#pragma once

#include <string>

namespace rag_core {

struct Chunk {
  std::string text;
  std::string source;
  int chunk_index = 0;
};

}  // namespace rag_core
