#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "mocks_test.hpp"
#include "rag_core/chunking/text_chunker.hpp"
#include "rag_core/errors.hpp"
#include "rag_core/index/flat_vector_index.hpp"
#include "rag_core/services/indexing_service.hpp"
#include "utilities_test.hpp"

namespace rag_tests {

using rag_core::Config;
using rag_core::IndexingService;

namespace {

const std::string DOCUMENT =
    "The sky is blue. Water is wet. Grass is green. The sun is bright. Snow is cold. "
    "Fire is hot. The sea is deep. Sand is dry. Ice is slippery. Night is dark.";

Config small_chunks(int batch_size) {
  Config config;
  config.chunk_size = 20;
  config.chunk_overlap = 5;
  config.ollama.embed_batch_size = batch_size;
  return config;
}

}  // namespace

class IndexingServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    embedder_ = std::make_shared<KeywordEmbedder>(
        std::vector<std::string>{"sky", "water", "grass", "sun", "snow", "fire", "sea", "night"});
    index_ = std::make_shared<rag_core::FlatVectorIndex>();
  }

  std::shared_ptr<KeywordEmbedder> embedder_;
  std::shared_ptr<rag_core::FlatVectorIndex> index_;
};

TEST_F(IndexingServiceTest, EmbedsInBatches) {
  const size_t expected_chunks = rag_core::split_text(DOCUMENT, 20, 5).size();
  ASSERT_GT(expected_chunks, 4u);

  IndexingService service(embedder_, index_, small_chunks(4));
  auto stats = service.index_document(DOCUMENT);

  EXPECT_EQ(stats.chunk_count, expected_chunks);
  EXPECT_EQ(stats.embedding_calls, (expected_chunks + 3) / 4);
  EXPECT_EQ(embedder_->batch_calls(), static_cast<int>(stats.embedding_calls));
  EXPECT_EQ(embedder_->embed_calls(), 0);
  EXPECT_EQ(index_->count(), expected_chunks);
}

TEST_F(IndexingServiceTest, BatchLargerThanDocumentUsesOneCall) {
  IndexingService service(embedder_, index_, small_chunks(1000));
  auto stats = service.index_document(DOCUMENT);
  EXPECT_EQ(stats.embedding_calls, 1u);
  EXPECT_EQ(index_->count(), stats.chunk_count);
}

TEST_F(IndexingServiceTest, ChunksKeepOrderAndPayload) {
  IndexingService service(embedder_, index_, small_chunks(3));
  service.index_document(DOCUMENT);

  // "snow" only occurs in one chunk of the document
  auto hits = index_->query(embedder_->embed("snow"), 1);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_NE(hits[0].entry.payload.text.find("Snow"), std::string::npos);

  const auto expected = rag_core::split_text(DOCUMENT, 20, 5);
  const auto& payload = hits[0].entry.payload;
  ASSERT_LT(static_cast<size_t>(payload.ordinal), expected.size());
  EXPECT_EQ(expected[static_cast<size_t>(payload.ordinal)], payload);
  EXPECT_EQ(hits[0].entry.id, payload.ordinal);
}

TEST_F(IndexingServiceTest, EmptyDocumentMakesNoCalls) {
  IndexingService service(embedder_, index_, small_chunks(4));
  auto stats = service.index_document("");
  EXPECT_EQ(stats.chunk_count, 0u);
  EXPECT_EQ(stats.embedding_calls, 0u);
  EXPECT_EQ(embedder_->batch_calls(), 0);
  EXPECT_EQ(index_->count(), 0u);
}

TEST_F(IndexingServiceTest, ShortBatchFromEmbedderIsAnError) {
  auto mock = std::make_shared<MockEmbeddingPort>();
  EXPECT_CALL(*mock, embed_many(::testing::_))
      .WillOnce(::testing::Return(std::vector<rag_core::Vector>{{1.0f, 0.0f}}));

  IndexingService service(mock, index_, small_chunks(8));
  EXPECT_THROW(service.index_document(DOCUMENT), rag_core::EmbeddingServiceError);
}

TEST_F(IndexingServiceTest, EmbedderFailurePropagates) {
  auto mock = std::make_shared<MockEmbeddingPort>();
  EXPECT_CALL(*mock, embed_many(::testing::_))
      .WillOnce(::testing::Throw(rag_core::EmbeddingServiceError("model not pulled")));

  IndexingService service(mock, index_, small_chunks(8));
  EXPECT_THROW(service.index_document(DOCUMENT), rag_core::EmbeddingServiceError);
  EXPECT_EQ(index_->count(), 0u);
}

TEST_F(IndexingServiceTest, ReplaceKeepsPreviousContentsWhenLaterBatchFails) {
  IndexingService seeded(embedder_, index_, small_chunks(4));
  const size_t previous = seeded.index_document(DOCUMENT).chunk_count;
  ASSERT_GT(previous, 0u);

  auto mock = std::make_shared<MockEmbeddingPort>();
  EXPECT_CALL(*mock, embed_many(::testing::_))
      .WillOnce(::testing::Return(std::vector<rag_core::Vector>{{1.0f, 0.0f}}))
      .WillOnce(::testing::Throw(rag_core::EmbeddingServiceError("connection reset")));

  IndexingService service(mock, index_, small_chunks(1));
  EXPECT_THROW(service.replace_document("The sky is blue. Water is wet."),
               rag_core::EmbeddingServiceError);
  EXPECT_EQ(index_->count(), previous);
}

TEST_F(IndexingServiceTest, ReplaceEmptiesIndexWhenInsertFails) {
  IndexingService seeded(embedder_, index_, small_chunks(4));
  seeded.index_document(DOCUMENT);

  // Second vector has a different width than the first
  auto mock = std::make_shared<MockEmbeddingPort>();
  EXPECT_CALL(*mock, embed_many(::testing::_))
      .WillOnce(::testing::Return(
          std::vector<rag_core::Vector>{{1.0f, 0.0f}, {1.0f, 0.0f, 0.0f}}));

  IndexingService service(mock, index_, small_chunks(8));
  EXPECT_THROW(service.replace_document("The sky is blue. Water is wet."),
               rag_core::DimensionMismatch);
  EXPECT_EQ(index_->count(), 0u);
}

TEST_F(IndexingServiceTest, ReplaceSwapsContents) {
  IndexingService service(embedder_, index_, small_chunks(4));
  service.index_document(DOCUMENT);

  auto stats = service.replace_document("Water is wet.");
  EXPECT_EQ(stats.chunk_count, 1u);
  EXPECT_EQ(index_->count(), 1u);

  service.replace_document("");
  EXPECT_EQ(index_->count(), 0u);
}

TEST_F(IndexingServiceTest, RejectsInvalidSetup) {
  EXPECT_THROW(IndexingService(embedder_, index_, small_chunks(0)), rag_core::InvalidConfig);
  EXPECT_THROW(IndexingService(nullptr, index_, small_chunks(1)), std::invalid_argument);

  Config bad_overlap = small_chunks(1);
  bad_overlap.chunk_overlap = bad_overlap.chunk_size;
  EXPECT_THROW(IndexingService(embedder_, index_, bad_overlap), rag_core::InvalidConfig);
}

}  // namespace rag_tests
