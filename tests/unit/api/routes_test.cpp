#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

#include "rag_api/prompts.hpp"
#include "rag_api/routes.hpp"
#include "rag_core/services/store_manager.hpp"
#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"

namespace rag_api {

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;

class RoutesTest : public rag_tests::StoreTestBase {
 protected:
  void SetUp() override {
    StoreTestBase::SetUp();
    embedder_ = std::make_shared<NiceMock<rag_tests::MockEmbedder>>(8);
    store_ = std::make_shared<rag_core::StoreManager>(
        embedder_, paths_,
        rag_core::StoreSettings{.chunk_size_words = 4, .chunk_overlap_words = 1, .default_top_k = 2});
    routes_ = std::make_unique<Routes>(store_);
  }

  std::shared_ptr<NiceMock<rag_tests::MockEmbedder>> embedder_;
  std::shared_ptr<rag_core::StoreManager> store_;
  std::unique_ptr<Routes> routes_;
};

TEST_F(RoutesTest, ToolDefinitionsDescribeBothTools) {
  nlohmann::json tools = Routes::tool_definitions();

  ASSERT_EQ(tools.size(), 2);
  EXPECT_EQ(tools[0]["name"], "ingest_document");
  EXPECT_EQ(tools[0]["input_schema"]["required"], nlohmann::json::array({"document"}));
  EXPECT_EQ(tools[0]["input_schema"]["properties"]["source"]["default"], "unknown");
  EXPECT_EQ(tools[1]["name"], "query_rag_store");
  EXPECT_EQ(tools[1]["input_schema"]["required"], nlohmann::json::array({"query"}));
  EXPECT_EQ(tools[1]["input_schema"]["properties"]["top_k"]["default"], 3);
}

TEST_F(RoutesTest, IngestDocumentReportsCounts) {
  nlohmann::json response =
      routes_->ingest_document({{"document", "a b c d e f g"}, {"source", "notes.txt"}});

  EXPECT_TRUE(response["success"].get<bool>());
  EXPECT_EQ(response["chunks_added"], 2);
  EXPECT_EQ(response["total_documents"], 2);
  EXPECT_FALSE(response.contains("error"));
}

TEST_F(RoutesTest, IngestDocumentDefaultsSource) {
  routes_->ingest_document({{"document", "one two"}});

  nlohmann::json listing = routes_->list_documents();
  ASSERT_EQ(listing["total"], 1);
  EXPECT_EQ(listing["documents"][0]["source"], "unknown");
}

TEST_F(RoutesTest, IngestDocumentRequiresDocument) {
  EXPECT_THROW(routes_->ingest_document({{"source", "x"}}), RequestError);
  EXPECT_THROW(routes_->ingest_document({{"document", 42}}), RequestError);
  EXPECT_THROW(routes_->ingest_document({{"document", "x"}, {"source", 1}}), RequestError);
}

TEST_F(RoutesTest, IngestFailureCarriesErrorKind) {
  EXPECT_CALL(*embedder_, embed(_)).WillRepeatedly(testing::Throw(std::runtime_error("offline")));

  nlohmann::json response = routes_->ingest_document({{"document", "a b c"}});

  EXPECT_FALSE(response["success"].get<bool>());
  EXPECT_EQ(response["chunks_added"], 0);
  EXPECT_EQ(response["kind"], "embedding_failure");
  EXPECT_EQ(response["error"], "offline");
}

TEST_F(RoutesTest, QueryUsesStoreDefaultTopK) {
  routes_->ingest_document({{"document", rag_tests::TestUtilities::make_words(20)}});

  nlohmann::json response = routes_->query_rag_store({{"query", "w0 w1 w2 w3"}});

  ASSERT_EQ(response["count"], 2);
  EXPECT_EQ(response["results"][0]["text"], "w0 w1 w2 w3");
  EXPECT_EQ(response["results"][0]["chunk_index"], 0);
  EXPECT_FLOAT_EQ(response["results"][0]["distance"].get<float>(), 0.0f);
  EXPECT_EQ(response["results"][0]["source"], "unknown");
}

TEST_F(RoutesTest, QueryHonoursExplicitTopK) {
  routes_->ingest_document({{"document", rag_tests::TestUtilities::make_words(20)}});

  EXPECT_EQ(routes_->query_rag_store({{"query", "w5"}, {"top_k", 5}})["count"], 5);
  EXPECT_EQ(routes_->query_rag_store({{"query", "w5"}, {"top_k", 5.0}})["count"], 5);
}

TEST_F(RoutesTest, QueryOnEmptyStoreReturnsEmptyResults) {
  nlohmann::json response = routes_->query_rag_store({{"query", "anything"}});

  EXPECT_EQ(response["count"], 0);
  EXPECT_TRUE(response["results"].empty());
}

TEST_F(RoutesTest, QueryRejectsBadArguments) {
  EXPECT_THROW(routes_->query_rag_store(nlohmann::json::object()), RequestError);
  EXPECT_THROW(routes_->query_rag_store({{"query", "x"}, {"top_k", "three"}}), RequestError);

  routes_->ingest_document({{"document", "a b c"}});
  EXPECT_THROW(routes_->query_rag_store({{"query", "x"}, {"top_k", 0}}), rag_core::ConfigError);
}

TEST_F(RoutesTest, TopKOutsideIntRangeIsRejected) {
  routes_->ingest_document({{"document", "a b c"}});

  EXPECT_THROW(routes_->query_rag_store({{"query", "x"}, {"top_k", 4294967297ULL}}), RequestError);
  EXPECT_THROW(routes_->query_rag_store({{"query", "x"}, {"top_k", 9223372036854775807LL}}),
               RequestError);
  EXPECT_THROW(routes_->query_rag_store({{"query", "x"}, {"top_k", -4294967297LL}}), RequestError);
}

TEST_F(RoutesTest, FractionalTopKIsRejected) {
  routes_->ingest_document({{"document", "a b c"}});

  EXPECT_THROW(routes_->query_rag_store({{"query", "x"}, {"top_k", 2.9}}), RequestError);
  EXPECT_THROW(routes_->query_rag_store({{"query", "x"}, {"top_k", 1e12}}), RequestError);
}

TEST_F(RoutesTest, ParseTopKAcceptsIntegralValues) {
  EXPECT_EQ(Routes::parse_top_k(7), 7);
  EXPECT_EQ(Routes::parse_top_k(7.0), 7);
  EXPECT_EQ(Routes::parse_top_k(2147483647U), 2147483647);
  EXPECT_EQ(Routes::parse_top_k(-1), -1);
  EXPECT_THROW(Routes::parse_top_k(true), RequestError);
}

TEST_F(RoutesTest, IngestReadsTextFileFromPath) {
  const auto file_path = temp_dir_ / "notes.txt";
  rag_tests::TestUtilities::write_file(file_path, "alpha beta\r\ngamma delta epsilon\r\n");

  nlohmann::json response = routes_->ingest_document({{"document", file_path.string()}});

  EXPECT_TRUE(response["success"].get<bool>());
  EXPECT_EQ(response["chunks_added"], 2);
  nlohmann::json listing = routes_->list_documents();
  ASSERT_EQ(listing["total"], 1);
  EXPECT_EQ(listing["documents"][0]["source"], "notes.txt");
}

TEST_F(RoutesTest, IngestFilePathKeepsExplicitSource) {
  const auto file_path = temp_dir_ / "guide.md";
  rag_tests::TestUtilities::write_file(file_path, "# Guide\n\nSome words here");

  routes_->ingest_document({{"document", file_path.string()}, {"source", "manual"}});

  EXPECT_EQ(routes_->list_documents()["documents"][0]["source"], "manual");
}

TEST_F(RoutesTest, IngestMissingOrUnsupportedFileIsRequestError) {
  const auto pdf_path = temp_dir_ / "report.pdf";
  rag_tests::TestUtilities::write_file(pdf_path, "%PDF-1.4");

  EXPECT_THROW(routes_->ingest_document({{"document", (temp_dir_ / "gone.txt").string()}}),
               RequestError);
  EXPECT_THROW(routes_->ingest_document({{"document", pdf_path.string()}}), RequestError);
  EXPECT_EQ(store_->size(), 0);
}

TEST_F(RoutesTest, GetPromptUsesGivenChunks) {
  nlohmann::json chunks = nlohmann::json::array(
      {{{"text", "FAISS is a similarity search library."}, {"source", "faiss.txt"}}});

  nlohmann::json response =
      routes_->get_prompt("extract-answer", {{"query", "What is FAISS?"}, {"chunks", chunks}});

  EXPECT_EQ(response["name"], "extract-answer");
  ASSERT_EQ(response["messages"].size(), 1);
  EXPECT_EQ(response["messages"][0]["role"], "user");
  EXPECT_EQ(response["messages"][0]["content"]["type"], "text");
  const std::string text = response["messages"][0]["content"]["text"].get<std::string>();
  EXPECT_THAT(text, HasSubstr("What is FAISS?"));
  EXPECT_THAT(text, HasSubstr("FAISS is a similarity search library."));
  EXPECT_THAT(text, HasSubstr("faiss.txt"));
}

TEST_F(RoutesTest, GetPromptFetchesChunksFromStore) {
  routes_->ingest_document({{"document", rag_tests::TestUtilities::make_words(8)},
                            {"source", "words.txt"}});

  nlohmann::json response =
      routes_->get_prompt("summarize-documents", {{"topic", "w0 w1 w2 w3"}, {"top_k", 1}});

  const std::string text = response["messages"][0]["content"]["text"].get<std::string>();
  EXPECT_THAT(text, HasSubstr("w0 w1 w2 w3"));
  EXPECT_THAT(text, HasSubstr("words.txt"));
  EXPECT_THAT(text, HasSubstr("200 words"));
}

TEST_F(RoutesTest, GetPromptRejectsUnknownNameAndMissingArgument) {
  EXPECT_THROW(routes_->get_prompt("translate", {{"query", "x"}}), PromptError);
  EXPECT_THROW(routes_->get_prompt("extract-answer", nlohmann::json::object()), PromptError);
}

TEST_F(RoutesTest, QueryReportsRerankScoreWhenReranked) {
  auto reranker = std::make_shared<NiceMock<rag_tests::MockReranker>>();
  auto store = std::make_shared<rag_core::StoreManager>(
      embedder_, paths_,
      rag_core::StoreSettings{.chunk_size_words = 2, .chunk_overlap_words = 0, .default_top_k = 1},
      reranker);
  Routes routes(store);
  routes.ingest_document({{"document", "a b c d"}});
  EXPECT_CALL(*reranker, score("a b", _)).WillOnce(Return(std::vector<float>{0.25f, 0.75f}));

  nlohmann::json response = routes.query_rag_store({{"query", "a b"}});

  ASSERT_EQ(response["count"], 1);
  EXPECT_EQ(response["results"][0]["text"], "c d");
  EXPECT_FLOAT_EQ(response["results"][0]["rerank_score"].get<float>(), 0.75f);
}

TEST_F(RoutesTest, QueryOmitsRerankScoreWithoutReranker) {
  routes_->ingest_document({{"document", "a b c"}});

  nlohmann::json response = routes_->query_rag_store({{"query", "a b c"}});

  ASSERT_EQ(response["count"], 1);
  EXPECT_FALSE(response["results"][0].contains("rerank_score"));
}

TEST_F(RoutesTest, ListDocumentsGroupsAndSortsBySource) {
  routes_->ingest_document({{"document", "a b c d e f g"}, {"source", "b.txt"}});
  routes_->ingest_document({{"document", "x y"}, {"source", "a.txt"}});

  nlohmann::json listing = routes_->list_documents();

  EXPECT_EQ(listing["total"], 2);
  EXPECT_EQ(listing["documents"][0]["source"], "a.txt");
  EXPECT_EQ(listing["documents"][0]["chunks"], 1);
  EXPECT_EQ(listing["documents"][1]["source"], "b.txt");
  EXPECT_EQ(listing["documents"][1]["chunks"], 2);
  EXPECT_TRUE(listing["documents"][1].contains("indexed_at"));
}

}  // namespace rag_api
