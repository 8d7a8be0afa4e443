#pragma once

#include <filesystem>
#include <string>

#include "rag_core/db/metadata_store.hpp"
#include "rag_core/index/vector_index.hpp"

namespace rag_core {

struct StorePaths {
  std::filesystem::path index_path;
  std::filesystem::path metadata_path;

  static StorePaths in_directory(const std::filesystem::path &directory,
                                 const std::string &index_file = "faiss.index",
                                 const std::string &metadata_file = "metadata.json") {
    return StorePaths{directory / index_file, directory / metadata_file};
  }
};

struct LoadedStore {
  VectorIndex index;
  MetadataStore metadata;
};

/**
 * @class StorePersistence
 * @brief Writes and reads the index/metadata file pair.
 *
 * The index is stored in FAISS's native format, the metadata as JSON. Each file
 * is written to a sibling ".tmp" file first and renamed into place, so a failed
 * save leaves the previous files intact.
 *
 * The two renames are not one atomic step. The previous index is moved to
 * "<index>.bak" before the new one goes in; if the metadata rename then fails
 * the backup is put back. Should the process die between the renames, the
 * index on disk is one batch ahead of the metadata and load() restores the
 * backup when its length matches the metadata. Any other length mismatch is
 * CorruptStore.
 */
class StorePersistence {
 public:
  // Throws IOFailureError if either file cannot be written, InvalidDocumentError
  // if an entry cannot be serialized (text that is not UTF-8)
  static void save(const StorePaths &paths, const VectorIndex &index,
                   const MetadataStore &metadata);

  /**
   * @brief Reads both files back.
   *
   * If neither file exists the result is an empty index of the given dimension
   * (0 leaves it unset) and an empty metadata store.
   *
   * @throws CorruptStoreError if only one file exists, either file cannot be
   *         parsed, or their lengths differ.
   * @throws IOFailureError if an existing file cannot be opened.
   */
  static LoadedStore load(const StorePaths &paths, int dimension = 0);

 private:
  static void write_index_file(const std::filesystem::path &path, const VectorIndex &index);
  static void write_metadata_file(const std::filesystem::path &path,
                                  const MetadataStore &metadata);
  static VectorIndex read_index_file(const std::filesystem::path &path);
  static MetadataStore read_metadata_file(const std::filesystem::path &path);
  static void ensure_parent_directory(const std::filesystem::path &path);
  static void commit(const std::filesystem::path &temp_path, const std::filesystem::path &path);
  static void commit_pair(const StorePaths &paths, const std::filesystem::path &index_temp,
                          const std::filesystem::path &metadata_temp);
  static std::filesystem::path backup_path_for(const std::filesystem::path &index_path);
};

}  // namespace rag_core
