#pragma once

#include <string>
#include <vector>

namespace rag_core {

/**
 * @class Embedder
 * @brief Capability interface that turns text into a fixed-length float vector.
 *
 * Implementations must return vectors of embed_dimension() components for every
 * input. The store never depends on a concrete model runtime, only on this
 * interface.
 */
class Embedder {
 public:
  virtual ~Embedder() = default;

  virtual std::vector<float> embed(const std::string &text) = 0;

  virtual int embed_dimension() const = 0;

  // Name recorded alongside the vectors in the metadata file
  virtual std::string model_name() const = 0;
};

}  // namespace rag_core
