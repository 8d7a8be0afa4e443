#include "rag_core/db/store_persistence.hpp"

#include <faiss/impl/FaissException.h>
#include <faiss/index_io.h>

#include <fstream>
#include <iostream>
#include <memory>

#include "rag_core/errors.hpp"

namespace rag_core {

namespace {

std::filesystem::path temp_path_for(const std::filesystem::path &path) {
  std::filesystem::path temp = path;
  temp += ".tmp";
  return temp;
}

void remove_if_present(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

bool file_exists(const std::filesystem::path &path) {
  std::error_code ec;
  const bool exists = std::filesystem::exists(path, ec);
  if (ec) {
    throw IOFailureError("Cannot inspect " + path.string() + ": " + ec.message());
  }
  return exists;
}

}  // namespace

void StorePersistence::ensure_parent_directory(const std::filesystem::path &path) {
  const auto parent = path.parent_path();
  if (parent.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    throw IOFailureError("Cannot create directory " + parent.string() + ": " + ec.message());
  }
}

void StorePersistence::commit(const std::filesystem::path &temp_path,
                              const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    std::filesystem::remove(temp_path, ec);
    throw IOFailureError("Cannot move " + temp_path.string() + " into place at " +
                         path.string());
  }
}

void StorePersistence::write_index_file(const std::filesystem::path &path,
                                        const VectorIndex &index) {
  ensure_parent_directory(path);
  try {
    faiss::write_index(&index.faiss_index(), path.c_str());
  } catch (const faiss::FaissException &e) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    throw IOFailureError("Failed to write index file " + path.string() + ": " + e.what());
  }
}

void StorePersistence::write_metadata_file(const std::filesystem::path &path,
                                           const MetadataStore &metadata) {
  ensure_parent_directory(path);
  std::ofstream file(path, std::ios::out | std::ios::trunc);
  if (!file.is_open()) {
    throw IOFailureError("Cannot open metadata file for writing: " + path.string());
  }
  try {
    file << metadata.to_json().dump(2);
  } catch (const nlohmann::json::exception &e) {
    file.close();
    remove_if_present(path);
    throw InvalidDocumentError("Cannot serialize metadata to " + path.string() + ": " + e.what());
  }
  file.flush();
  if (!file) {
    file.close();
    std::error_code ec;
    std::filesystem::remove(path, ec);
    throw IOFailureError("Failed to write metadata file " + path.string());
  }
}

std::filesystem::path StorePersistence::backup_path_for(const std::filesystem::path &index_path) {
  std::filesystem::path backup = index_path;
  backup += ".bak";
  return backup;
}

void StorePersistence::commit_pair(const StorePaths &paths, const std::filesystem::path &index_temp,
                                   const std::filesystem::path &metadata_temp) {
  const auto backup = backup_path_for(paths.index_path);
  const bool had_index = file_exists(paths.index_path);
  if (had_index) {
    std::error_code ec;
    std::filesystem::rename(paths.index_path, backup, ec);
    if (ec) {
      throw IOFailureError("Cannot back up " + paths.index_path.string() + ": " + ec.message());
    }
  }

  try {
    commit(index_temp, paths.index_path);
    commit(metadata_temp, paths.metadata_path);
  } catch (const IOFailureError &) {
    // Put the previous index back so the files on disk still describe one store
    std::error_code ec;
    if (had_index) {
      std::filesystem::rename(backup, paths.index_path, ec);
    } else {
      std::filesystem::remove(paths.index_path, ec);
    }
    if (ec) {
      std::cerr << "Warning: could not restore " << paths.index_path << " after a failed save: "
                << ec.message() << std::endl;
    }
    throw;
  }

  if (had_index) {
    std::error_code ec;
    std::filesystem::remove(backup, ec);
    if (ec) {
      std::cerr << "Warning: could not remove " << backup << ": " << ec.message() << std::endl;
    }
  }
}

void StorePersistence::save(const StorePaths &paths, const VectorIndex &index,
                            const MetadataStore &metadata) {
  if (index.length() != metadata.length()) {
    throw CorruptStoreError("Refusing to save " + std::to_string(index.length()) +
                            " vectors with " + std::to_string(metadata.length()) +
                            " metadata entries");
  }
  // Both temporaries are complete before either target is replaced
  const auto index_temp = temp_path_for(paths.index_path);
  const auto metadata_temp = temp_path_for(paths.metadata_path);
  try {
    write_index_file(index_temp, index);
    write_metadata_file(metadata_temp, metadata);
    commit_pair(paths, index_temp, metadata_temp);
  } catch (...) {
    remove_if_present(index_temp);
    remove_if_present(metadata_temp);
    throw;
  }
}

VectorIndex StorePersistence::read_index_file(const std::filesystem::path &path) {
  std::unique_ptr<faiss::Index> raw;
  try {
    raw.reset(faiss::read_index(path.c_str()));
  } catch (const faiss::FaissException &e) {
    throw CorruptStoreError("Failed to read index file " + path.string() + ": " + e.what());
  }

  auto *flat = dynamic_cast<faiss::IndexFlatL2 *>(raw.get());
  if (flat == nullptr) {
    throw CorruptStoreError("Index file " + path.string() + " does not hold a flat L2 index");
  }
  raw.release();
  return VectorIndex(std::unique_ptr<faiss::IndexFlatL2>(flat));
}

MetadataStore StorePersistence::read_metadata_file(const std::filesystem::path &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw IOFailureError("Cannot open metadata file: " + path.string());
  }

  nlohmann::json json;
  try {
    json = nlohmann::json::parse(file);
  } catch (const nlohmann::json::parse_error &e) {
    throw CorruptStoreError("Metadata file " + path.string() + " is not valid JSON: " + e.what());
  }
  return MetadataStore::from_json(json);
}

LoadedStore StorePersistence::load(const StorePaths &paths, int dimension) {
  const bool has_index = file_exists(paths.index_path);
  const bool has_metadata = file_exists(paths.metadata_path);

  if (!has_index && !has_metadata) {
    return LoadedStore{VectorIndex(dimension), MetadataStore()};
  }
  if (!has_index) {
    throw CorruptStoreError("Metadata file " + paths.metadata_path.string() +
                            " exists but index file " + paths.index_path.string() +
                            " is missing");
  }
  if (!has_metadata) {
    throw CorruptStoreError("Index file " + paths.index_path.string() +
                            " exists but metadata file " + paths.metadata_path.string() +
                            " is missing");
  }

  VectorIndex index = read_index_file(paths.index_path);
  MetadataStore metadata = read_metadata_file(paths.metadata_path);

  if (index.length() != metadata.length()) {
    const auto backup = backup_path_for(paths.index_path);
    if (file_exists(backup)) {
      VectorIndex previous = read_index_file(backup);
      if (previous.length() == metadata.length()) {
        std::cerr << "Warning: " << paths.index_path << " holds " << index.length()
                  << " vectors but the metadata holds " << metadata.length()
                  << "; restoring the previous index from " << backup << std::endl;
        std::error_code ec;
        std::filesystem::rename(backup, paths.index_path, ec);
        if (ec) {
          throw IOFailureError("Cannot restore " + paths.index_path.string() + " from " +
                               backup.string() + ": " + ec.message());
        }
        return LoadedStore{std::move(previous), std::move(metadata)};
      }
    }
    throw CorruptStoreError("Index holds " + std::to_string(index.length()) +
                            " vectors but metadata holds " + std::to_string(metadata.length()) +
                            " entries");
  }
  return LoadedStore{std::move(index), std::move(metadata)};
}

}  // namespace rag_core
