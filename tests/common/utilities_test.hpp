#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "rag_core/db/store_persistence.hpp"
#include "rag_core/embedder.hpp"

namespace rag_tests {

/**
 * Utility class providing common functionality for all tests
 */
class TestUtilities {
 public:
  // Filesystem utilities
  static std::filesystem::path create_temp_test_dir();
  static void cleanup_temp_dir(const std::filesystem::path& dir);
  static void write_file(const std::filesystem::path& path, const std::string& contents);
  static std::string read_file(const std::filesystem::path& path);

  // Test data creation
  // "w0 w1 w2 ..." with `count` distinct words
  static std::string make_words(int count, const std::string& prefix = "w");

  // Deterministic vector derived from the seed text
  static std::vector<float> create_test_vector(const std::string& seed_text, int dimension = 8);

  static float squared_l2(const std::vector<float>& a, const std::vector<float>& b);
};

/**
 * Deterministic embedder: equal text gives equal vectors, different text
 * almost surely gives different ones.
 */
class HashingEmbedder : public rag_core::Embedder {
 public:
  explicit HashingEmbedder(int dimension = 8, std::string model = "hashing-test")
      : dimension_(dimension), model_(std::move(model)) {}

  std::vector<float> embed(const std::string& text) override {
    return TestUtilities::create_test_vector(text, dimension_);
  }

  int embed_dimension() const override {
    return dimension_;
  }

  std::string model_name() const override {
    return model_;
  }

 private:
  int dimension_;
  std::string model_;
};

/**
 * Base test fixture that provides a fresh store directory per test
 */
class StoreTestBase : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_dir_ = TestUtilities::create_temp_test_dir();
    paths_ = rag_core::StorePaths::in_directory(temp_dir_);
  }

  void TearDown() override {
    TestUtilities::cleanup_temp_dir(temp_dir_);
  }

  std::filesystem::path temp_dir_;
  rag_core::StorePaths paths_;
};

}  // namespace rag_tests
