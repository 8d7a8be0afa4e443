#include "rag_core/index/vector_index.hpp"

#include <faiss/impl/IDSelector.h>

#include <algorithm>
#include <string>

#include "rag_core/errors.hpp"

namespace rag_core {

VectorIndex::VectorIndex(int dimension) {
  if (dimension < 0) {
    throw DimensionMismatchError("Vector index dimension cannot be negative, got " +
                                 std::to_string(dimension));
  }
  index_ = std::make_unique<faiss::IndexFlatL2>(dimension);
}

VectorIndex::VectorIndex(std::unique_ptr<faiss::IndexFlatL2> index) : index_(std::move(index)) {
  if (!index_) {
    index_ = std::make_unique<faiss::IndexFlatL2>(0);
  }
}

VectorIndex::~VectorIndex() = default;

VectorIndex::VectorIndex(VectorIndex &&other) noexcept : index_(std::move(other.index_)) {}

VectorIndex &VectorIndex::operator=(VectorIndex &&other) noexcept {
  if (this != &other) {
    index_ = std::move(other.index_);
  }
  return *this;
}

void VectorIndex::validate_vector_dimension(const std::vector<float> &vector) const {
  if (vector.size() != static_cast<size_t>(index_->d)) {
    throw DimensionMismatchError("Vector dimension mismatch. Expected " +
                                 std::to_string(index_->d) + ", got " +
                                 std::to_string(vector.size()));
  }
}

size_t VectorIndex::append(const std::vector<float> &vector) {
  // First vector into an unset index decides the dimension
  if (index_->d == 0 && index_->ntotal == 0) {
    if (vector.empty()) {
      throw DimensionMismatchError("Cannot append an empty vector");
    }
    index_ = std::make_unique<faiss::IndexFlatL2>(static_cast<faiss::idx_t>(vector.size()));
  }
  validate_vector_dimension(vector);

  const size_t position = static_cast<size_t>(index_->ntotal);
  index_->add(1, vector.data());
  return position;
}

std::vector<Neighbor> VectorIndex::search(const std::vector<float> &query, int k) const {
  if (k <= 0 || index_->ntotal == 0) {
    return {};
  }
  validate_vector_dimension(query);

  // Ask faiss for the full ranking so equal distances can be ordered by position
  // before cutting down to k.
  const faiss::idx_t total = index_->ntotal;
  std::vector<float> distances(total);
  std::vector<faiss::idx_t> labels(total);
  index_->search(1, query.data(), total, distances.data(), labels.data());

  std::vector<Neighbor> neighbors;
  neighbors.reserve(total);
  for (faiss::idx_t i = 0; i < total; ++i) {
    if (labels[i] < 0)
      continue;
    neighbors.push_back({static_cast<size_t>(labels[i]), distances[i]});
  }

  std::sort(neighbors.begin(), neighbors.end(), [](const Neighbor &a, const Neighbor &b) {
    if (a.distance != b.distance)
      return a.distance < b.distance;
    return a.position < b.position;
  });

  if (neighbors.size() > static_cast<size_t>(k)) {
    neighbors.resize(static_cast<size_t>(k));
  }
  return neighbors;
}

size_t VectorIndex::length() const {
  return static_cast<size_t>(index_->ntotal);
}

int VectorIndex::dimension() const {
  return static_cast<int>(index_->d);
}

std::vector<float> VectorIndex::vector_at(size_t position) const {
  if (position >= length()) {
    throw OutOfRangeError("Vector position " + std::to_string(position) +
                          " is out of range for index of length " + std::to_string(length()));
  }
  std::vector<float> vector(static_cast<size_t>(index_->d));
  index_->reconstruct(static_cast<faiss::idx_t>(position), vector.data());
  return vector;
}

void VectorIndex::truncate(size_t length) {
  if (length >= this->length()) {
    return;
  }
  faiss::IDSelectorRange tail(static_cast<faiss::idx_t>(length), index_->ntotal);
  index_->remove_ids(tail);
}

}  // namespace rag_core
