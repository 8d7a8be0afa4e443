#pragma once

#include <faiss/IndexFlat.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <vector>

namespace rag_core {

struct Neighbor {
  size_t position;
  float distance;  // squared L2, not rooted
};

/**
 * @class VectorIndex
 * @brief Append-only exact nearest-neighbour index over squared L2 distance.
 *
 * Vectors live densely packed in a faiss::IndexFlatL2 in insertion order, so a
 * vector's position is its FAISS id. Every query compares against every stored
 * vector (O(N*D)); there is no approximate structure.
 *
 * Distances are squared Euclidean, sum((q_i - v_i)^2). Ranking is the same as
 * for the true metric but callers must not treat the value as one.
 */
class VectorIndex {
 public:
  // A dimension of 0 leaves the index unset until the first append fixes it
  explicit VectorIndex(int dimension = 0);
  explicit VectorIndex(std::unique_ptr<faiss::IndexFlatL2> index);
  ~VectorIndex();

  // Disable copy constructor and assignment
  VectorIndex(const VectorIndex &) = delete;
  VectorIndex &operator=(const VectorIndex &) = delete;

  // Allow move constructor and assignment
  VectorIndex(VectorIndex &&) noexcept;
  VectorIndex &operator=(VectorIndex &&) noexcept;

  /**
   * @brief Appends a vector at the end of the index.
   * @return The zero-based position assigned, equal to the prior length.
   * @throws DimensionMismatchError if the vector length differs from dimension().
   */
  size_t append(const std::vector<float> &vector);

  /**
   * @brief Exact k-NN search.
   *
   * Results are ordered by ascending distance, ties by ascending position. An
   * empty index or k <= 0 yields no results; fewer than k stored vectors yields
   * all of them.
   *
   * @throws DimensionMismatchError if the index is non-empty and the query length
   *         differs from dimension().
   */
  std::vector<Neighbor> search(const std::vector<float> &query, int k) const;

  size_t length() const;
  int dimension() const;

  // Exact stored values at a position. Throws OutOfRangeError past the end.
  std::vector<float> vector_at(size_t position) const;

  // Drops every vector at or after `length`
  void truncate(size_t length);

  const faiss::IndexFlatL2 &faiss_index() const {
    return *index_;
  }

 private:
  std::unique_ptr<faiss::IndexFlatL2> index_;

  void validate_vector_dimension(const std::vector<float> &vector) const;
};

}  // namespace rag_core
