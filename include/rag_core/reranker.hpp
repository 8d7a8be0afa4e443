#pragma once

#include <string>
#include <vector>

namespace rag_core {

/**
 * @class Reranker
 * @brief Scores candidate passages against a query after vector retrieval.
 *
 * score() returns one value per passage, in passage order. Higher means more
 * relevant; implementations should keep scores within [0, 1].
 */
class Reranker {
 public:
  virtual ~Reranker() = default;

  virtual std::vector<float> score(const std::string &query,
                                   const std::vector<std::string> &passages) = 0;

  virtual std::string model_name() const = 0;
};

}  // namespace rag_core
