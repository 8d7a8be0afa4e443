#pragma once

#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "rag_core/types/record.hpp"

namespace rag_core {

void to_json(nlohmann::json &j, const MetadataEntry &entry);

/**
 * @class MetadataStore
 * @brief Ordered, append-only list of chunk metadata.
 *
 * Position is the join key with VectorIndex: entry i describes vector i. The
 * caller appends to both in lock-step.
 */
class MetadataStore {
 public:
  MetadataStore() = default;
  explicit MetadataStore(std::string model) : model_(std::move(model)) {}

  size_t append(MetadataEntry entry);

  // Throws OutOfRangeError if position >= length()
  const MetadataEntry &get(size_t position) const;

  size_t length() const {
    return entries_.size();
  }

  // Drops every entry at or after `length`
  void truncate(size_t length);

  const std::vector<MetadataEntry> &entries() const {
    return entries_;
  }

  const std::string &model() const {
    return model_;
  }
  void set_model(const std::string &model) {
    model_ = model;
  }

  // One summary per distinct source, sorted by source name
  std::vector<DocumentSummary> summarize_sources() const;

  nlohmann::json to_json() const;

  /**
   * @brief Rebuilds a store from its JSON form.
   *
   * Expects {"model": str, "documents": [{"id", "text", "source", "chunk_index",
   * "indexed_at"}, ...]}. Only text is required: a missing source reads as
   * "unknown", a missing chunk_index as 0 and a missing indexed_at as empty.
   *
   * @throws CorruptStoreError if the layout is wrong or an id disagrees with its
   *         position.
   */
  static MetadataStore from_json(const nlohmann::json &json);

 private:
  std::string model_;
  std::vector<MetadataEntry> entries_;

  static MetadataEntry entry_from_json(const nlohmann::json &document, size_t position);
};

}  // namespace rag_core
