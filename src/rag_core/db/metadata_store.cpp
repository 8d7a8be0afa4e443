#include "rag_core/db/metadata_store.hpp"

#include <limits>
#include <map>

#include "rag_core/errors.hpp"

namespace rag_core {

void to_json(nlohmann::json &j, const MetadataEntry &entry) {
  j = nlohmann::json{{"text", entry.text},
                     {"source", entry.source},
                     {"chunk_index", entry.chunk_index},
                     {"indexed_at", entry.indexed_at}};
}

size_t MetadataStore::append(MetadataEntry entry) {
  entries_.push_back(std::move(entry));
  return entries_.size() - 1;
}

const MetadataEntry &MetadataStore::get(size_t position) const {
  if (position >= entries_.size()) {
    throw OutOfRangeError("Metadata position " + std::to_string(position) +
                          " is out of range for store of length " +
                          std::to_string(entries_.size()));
  }
  return entries_[position];
}

void MetadataStore::truncate(size_t length) {
  if (length < entries_.size()) {
    entries_.resize(length);
  }
}

std::vector<DocumentSummary> MetadataStore::summarize_sources() const {
  std::map<std::string, DocumentSummary> by_source;
  for (const auto &entry : entries_) {
    DocumentSummary &summary = by_source[entry.source];
    summary.source = entry.source;
    summary.chunks++;
    // ISO-8601 strings order chronologically
    if (entry.indexed_at > summary.indexed_at) {
      summary.indexed_at = entry.indexed_at;
    }
  }

  std::vector<DocumentSummary> summaries;
  summaries.reserve(by_source.size());
  for (auto &[source, summary] : by_source) {
    summaries.push_back(std::move(summary));
  }
  return summaries;
}

nlohmann::json MetadataStore::to_json() const {
  nlohmann::json documents = nlohmann::json::array();
  for (size_t i = 0; i < entries_.size(); ++i) {
    nlohmann::json document = entries_[i];
    document["id"] = i;
    documents.push_back(std::move(document));
  }

  nlohmann::json json;
  json["model"] = model_;
  json["documents"] = std::move(documents);
  return json;
}

MetadataEntry MetadataStore::entry_from_json(const nlohmann::json &document, size_t position) {
  const std::string where = "metadata document " + std::to_string(position);
  if (!document.is_object()) {
    throw CorruptStoreError(where + " is not an object");
  }
  if (document.contains("id")) {
    if (!document["id"].is_number_integer() ||
        document["id"].get<long long>() != static_cast<long long>(position)) {
      throw CorruptStoreError(where + " has id " + document["id"].dump() +
                              " which does not match its position");
    }
  }
  if (!document.contains("text") || !document["text"].is_string()) {
    throw CorruptStoreError(where + " is missing its text");
  }
  if (document.contains("chunk_index")) {
    const auto &chunk_index = document["chunk_index"];
    if (!chunk_index.is_number_integer()) {
      throw CorruptStoreError(where + " has a non-integer chunk_index");
    }
    if (chunk_index.is_number_unsigned()
            ? chunk_index.get<unsigned long long>() >
                  static_cast<unsigned long long>(std::numeric_limits<int>::max())
            : (chunk_index.get<long long>() < 0 ||
               chunk_index.get<long long>() > std::numeric_limits<int>::max())) {
      throw CorruptStoreError(where + " has chunk_index " + chunk_index.dump() +
                              " outside the range of a chunk position");
    }
  }

  MetadataEntry entry;
  entry.text = document["text"].get<std::string>();
  entry.chunk_index = document.contains("chunk_index") ? document["chunk_index"].get<int>() : 0;
  try {
    entry.source = document.value("source", std::string("unknown"));
    entry.indexed_at = document.value("indexed_at", std::string());
  } catch (const nlohmann::json::type_error &e) {
    throw CorruptStoreError(where + " has a malformed field: " + std::string(e.what()));
  }
  return entry;
}

MetadataStore MetadataStore::from_json(const nlohmann::json &json) {
  if (!json.is_object()) {
    throw CorruptStoreError("metadata root is not an object");
  }
  if (!json.contains("documents") || !json["documents"].is_array()) {
    throw CorruptStoreError("metadata has no documents array");
  }

  MetadataStore store;
  if (json.contains("model") && json["model"].is_string()) {
    store.model_ = json["model"].get<std::string>();
  }

  const auto &documents = json["documents"];
  store.entries_.reserve(documents.size());
  for (size_t i = 0; i < documents.size(); ++i) {
    store.entries_.push_back(entry_from_json(documents[i], i));
  }
  return store;
}

}  // namespace rag_core
