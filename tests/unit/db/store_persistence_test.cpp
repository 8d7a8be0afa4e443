#include <gtest/gtest.h>

#include <faiss/Index.h>
#include <faiss/index_io.h>

#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>

#include "rag_core/db/store_persistence.hpp"
#include "rag_core/errors.hpp"
#include "../../common/utilities_test.hpp"

namespace rag_core {

class StorePersistenceTest : public rag_tests::StoreTestBase {
 protected:
  static constexpr int kDimension = 6;

  // Fills index and metadata with `count` aligned records
  void populate(VectorIndex& index, MetadataStore& metadata, int count) {
    for (int i = 0; i < count; ++i) {
      std::string text = "chunk text " + std::to_string(i);
      index.append(rag_tests::TestUtilities::create_test_vector(text, kDimension));
      metadata.append(MetadataEntry{.text = text,
                                    .source = i % 2 == 0 ? "even.txt" : "odd.txt",
                                    .chunk_index = i / 2,
                                    .indexed_at = "2024-12-08T14:23:00"});
    }
  }
};

TEST_F(StorePersistenceTest, LoadWithNoFilesGivesEmptyStore) {
  LoadedStore loaded = StorePersistence::load(paths_, kDimension);

  EXPECT_EQ(loaded.index.length(), 0);
  EXPECT_EQ(loaded.index.dimension(), kDimension);
  EXPECT_EQ(loaded.metadata.length(), 0);
}

TEST_F(StorePersistenceTest, SaveThenLoadReproducesEveryRecord) {
  VectorIndex index(kDimension);
  MetadataStore metadata("test-model");
  populate(index, metadata, 9);

  StorePersistence::save(paths_, index, metadata);
  LoadedStore loaded = StorePersistence::load(paths_);

  ASSERT_EQ(loaded.index.length(), 9);
  ASSERT_EQ(loaded.metadata.length(), 9);
  EXPECT_EQ(loaded.index.dimension(), kDimension);
  EXPECT_EQ(loaded.metadata.model(), "test-model");
  EXPECT_EQ(loaded.metadata.entries(), metadata.entries());
  for (size_t i = 0; i < 9; ++i) {
    EXPECT_EQ(loaded.index.vector_at(i), index.vector_at(i)) << "position " << i;
  }
}

TEST_F(StorePersistenceTest, SavingTwiceWithoutChangesIsIdempotent) {
  VectorIndex index(kDimension);
  MetadataStore metadata("test-model");
  populate(index, metadata, 4);

  StorePersistence::save(paths_, index, metadata);
  std::string first_metadata = rag_tests::TestUtilities::read_file(paths_.metadata_path);
  std::string first_index = rag_tests::TestUtilities::read_file(paths_.index_path);

  StorePersistence::save(paths_, index, metadata);
  EXPECT_EQ(rag_tests::TestUtilities::read_file(paths_.metadata_path), first_metadata);
  EXPECT_EQ(rag_tests::TestUtilities::read_file(paths_.index_path), first_index);

  LoadedStore loaded = StorePersistence::load(paths_);
  EXPECT_EQ(loaded.metadata.entries(), metadata.entries());
}

TEST_F(StorePersistenceTest, SaveLeavesNoTemporaryFiles) {
  VectorIndex index(kDimension);
  MetadataStore metadata;
  populate(index, metadata, 2);

  StorePersistence::save(paths_, index, metadata);

  for (const auto& entry : std::filesystem::directory_iterator(temp_dir_)) {
    EXPECT_NE(entry.path().extension(), ".tmp") << entry.path();
  }
}

TEST_F(StorePersistenceTest, SaveCreatesMissingParentDirectories) {
  auto nested = StorePaths::in_directory(temp_dir_ / "a" / "b");
  VectorIndex index(kDimension);
  MetadataStore metadata;
  populate(index, metadata, 1);

  StorePersistence::save(nested, index, metadata);

  EXPECT_TRUE(std::filesystem::exists(nested.index_path));
  EXPECT_TRUE(std::filesystem::exists(nested.metadata_path));
}

TEST_F(StorePersistenceTest, SaveIntoUnwritableLocationThrowsIOFailure) {
  // A regular file where the directory should be
  rag_tests::TestUtilities::write_file(temp_dir_ / "blocker", "not a directory");
  auto blocked = StorePaths::in_directory(temp_dir_ / "blocker" / "store");
  VectorIndex index(kDimension);
  MetadataStore metadata;
  populate(index, metadata, 1);

  EXPECT_THROW(StorePersistence::save(blocked, index, metadata), IOFailureError);
}

TEST_F(StorePersistenceTest, IndexWithoutMetadataIsCorrupt) {
  VectorIndex index(kDimension);
  MetadataStore metadata;
  populate(index, metadata, 3);
  StorePersistence::save(paths_, index, metadata);
  std::filesystem::remove(paths_.metadata_path);

  EXPECT_THROW(StorePersistence::load(paths_), CorruptStoreError);
}

TEST_F(StorePersistenceTest, MetadataWithoutIndexIsCorrupt) {
  rag_tests::TestUtilities::write_file(paths_.metadata_path,
                                       R"({"model": "m", "documents": []})");

  EXPECT_THROW(StorePersistence::load(paths_), CorruptStoreError);
}

TEST_F(StorePersistenceTest, LengthMismatchIsCorruptAndNeverTruncated) {
  VectorIndex index(kDimension);
  MetadataStore metadata;
  populate(index, metadata, 3);
  StorePersistence::save(paths_, index, metadata);

  // Drop one metadata entry behind the store's back
  nlohmann::json json = nlohmann::json::parse(
      rag_tests::TestUtilities::read_file(paths_.metadata_path));
  json["documents"].erase(json["documents"].size() - 1);
  rag_tests::TestUtilities::write_file(paths_.metadata_path, json.dump());

  try {
    StorePersistence::load(paths_);
    FAIL() << "Expected CorruptStoreError";
  } catch (const CorruptStoreError& e) {
    EXPECT_EQ(e.kind(), StoreErrorKind::CorruptStore);
  }
}

TEST_F(StorePersistenceTest, InterruptedSaveIsRecoveredFromIndexBackup) {
  VectorIndex index(kDimension);
  MetadataStore metadata("m");
  populate(index, metadata, 2);
  StorePersistence::save(paths_, index, metadata);
  const auto two_index = temp_dir_ / "two.index";
  const auto two_metadata = temp_dir_ / "two.json";
  std::filesystem::copy_file(paths_.index_path, two_index);
  std::filesystem::copy_file(paths_.metadata_path, two_metadata);

  populate(index, metadata, 1);
  StorePersistence::save(paths_, index, metadata);

  // State left by a crash between the index rename and the metadata rename
  auto backup = paths_.index_path;
  backup += ".bak";
  std::filesystem::copy_file(two_index, backup);
  std::filesystem::copy_file(two_metadata, paths_.metadata_path,
                             std::filesystem::copy_options::overwrite_existing);

  LoadedStore loaded = StorePersistence::load(paths_);

  EXPECT_EQ(loaded.index.length(), 2);
  EXPECT_EQ(loaded.metadata.length(), 2);
  EXPECT_FALSE(std::filesystem::exists(backup));
  EXPECT_EQ(StorePersistence::load(paths_).index.length(), 2);
}

TEST_F(StorePersistenceTest, BackupWithOtherLengthDoesNotMaskCorruption) {
  VectorIndex index(kDimension);
  MetadataStore metadata("m");
  populate(index, metadata, 3);
  StorePersistence::save(paths_, index, metadata);
  auto backup = paths_.index_path;
  backup += ".bak";
  std::filesystem::copy_file(paths_.index_path, backup);

  nlohmann::json json = nlohmann::json::parse(
      rag_tests::TestUtilities::read_file(paths_.metadata_path));
  json["documents"].erase(json["documents"].size() - 1);
  rag_tests::TestUtilities::write_file(paths_.metadata_path, json.dump());

  EXPECT_THROW(StorePersistence::load(paths_), CorruptStoreError);
  EXPECT_TRUE(std::filesystem::exists(backup));
}

TEST_F(StorePersistenceTest, FailedMetadataRenameRestoresPreviousIndex) {
  VectorIndex index(kDimension);
  MetadataStore metadata("m");
  populate(index, metadata, 2);
  StorePersistence::save(paths_, index, metadata);

  std::filesystem::remove(paths_.metadata_path);
  std::filesystem::create_directories(paths_.metadata_path / "occupied");
  populate(index, metadata, 1);

  EXPECT_THROW(StorePersistence::save(paths_, index, metadata), IOFailureError);

  std::unique_ptr<faiss::Index> on_disk(faiss::read_index(paths_.index_path.c_str()));
  EXPECT_EQ(on_disk->ntotal, 2);
  for (const auto& entry : std::filesystem::directory_iterator(temp_dir_)) {
    EXPECT_NE(entry.path().extension(), ".tmp") << entry.path();
    EXPECT_NE(entry.path().extension(), ".bak") << entry.path();
  }
}

TEST_F(StorePersistenceTest, UnserializableTextIsInvalidDocumentAndLeavesFilesIntact) {
  VectorIndex index(kDimension);
  MetadataStore metadata("m");
  populate(index, metadata, 1);
  StorePersistence::save(paths_, index, metadata);
  const std::string saved_metadata = rag_tests::TestUtilities::read_file(paths_.metadata_path);

  index.append(rag_tests::TestUtilities::create_test_vector("latin1", kDimension));
  metadata.append(MetadataEntry{.text = "caf\xE9", .source = "latin1.txt"});

  EXPECT_THROW(StorePersistence::save(paths_, index, metadata), InvalidDocumentError);

  EXPECT_EQ(rag_tests::TestUtilities::read_file(paths_.metadata_path), saved_metadata);
  EXPECT_EQ(StorePersistence::load(paths_).index.length(), 1);
  for (const auto& entry : std::filesystem::directory_iterator(temp_dir_)) {
    EXPECT_NE(entry.path().extension(), ".tmp") << entry.path();
  }
}

TEST_F(StorePersistenceTest, GarbageIndexFileIsCorrupt) {
  rag_tests::TestUtilities::write_file(paths_.index_path, "definitely not a faiss index");
  rag_tests::TestUtilities::write_file(paths_.metadata_path,
                                       R"({"model": "m", "documents": []})");

  EXPECT_THROW(StorePersistence::load(paths_), CorruptStoreError);
}

TEST_F(StorePersistenceTest, InvalidMetadataJsonIsCorrupt) {
  VectorIndex index(kDimension);
  MetadataStore metadata;
  populate(index, metadata, 1);
  StorePersistence::save(paths_, index, metadata);
  rag_tests::TestUtilities::write_file(paths_.metadata_path, "{ not json");

  EXPECT_THROW(StorePersistence::load(paths_), CorruptStoreError);
}

TEST_F(StorePersistenceTest, EmptyStoreRoundTrips) {
  VectorIndex index(kDimension);
  MetadataStore metadata("m");

  StorePersistence::save(paths_, index, metadata);
  LoadedStore loaded = StorePersistence::load(paths_);

  EXPECT_EQ(loaded.index.length(), 0);
  EXPECT_EQ(loaded.metadata.length(), 0);
}

}  // namespace rag_core
