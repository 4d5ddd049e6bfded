#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <future>
#include <optional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"
#include "docqa_core/errors.hpp"
#include "docqa_core/hashing.hpp"
#include "docqa_core/services/document_delete_service.hpp"
#include "docqa_core/services/ingestion_service.hpp"

namespace docqa_core {

using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

namespace {

std::vector<std::vector<float>> fake_embeddings(const std::vector<std::string>& texts) {
  std::vector<std::vector<float>> vectors;
  for (const auto& text : texts) {
    vectors.push_back({static_cast<float>(text.size()), static_cast<float>(text[0]), 1.0f});
  }
  return vectors;
}

}  // namespace

class IngestionServiceTest : public docqa_tests::MetadataStoreTestBase {
 protected:
  void SetUp() override {
    MetadataStoreTestBase::SetUp();
    config_.chunk_size = 100;
    config_.overlap = 20;
    config_.embedding_max_attempts = 1;
    mock_client_ = std::make_shared<docqa_tests::MockOllamaClient>();
    embedding_client_ = std::make_shared<EmbeddingClient>(
        mock_client_, config_, [](std::chrono::milliseconds) {});
    index_ = std::make_shared<VectorIndex>();
    service_ = std::make_unique<IngestionService>(embedding_client_, index_, metadata_store_,
                                                  config_);
  }

  void embed_normally() {
    ON_CALL(*mock_client_, get_embeddings(_)).WillByDefault(Invoke(fake_embeddings));
  }

  RetrievalConfig config_;
  std::shared_ptr<docqa_tests::MockOllamaClient> mock_client_;
  std::shared_ptr<EmbeddingClient> embedding_client_;
  std::shared_ptr<VectorIndex> index_;
  std::unique_ptr<IngestionService> service_;
};

TEST_F(IngestionServiceTest, IngestWritesDocumentChunksAndIndex) {
  embed_normally();
  EXPECT_CALL(*mock_client_, get_embeddings(_)).Times(1);
  const std::string text = docqa_tests::TestUtilities::create_test_text(250);

  IngestResult result = service_->ingest("manual", "manual.pdf", text);

  EXPECT_EQ(result.document_id, "manual");
  EXPECT_EQ(result.chunk_count, 4);
  EXPECT_EQ(result.page_count, 1);
  EXPECT_FALSE(result.skipped);

  auto document = metadata_store_->get_document("manual");
  ASSERT_TRUE(document.has_value());
  EXPECT_EQ(document->filename, "manual.pdf");
  EXPECT_EQ(document->content_hash, sha256_hex(text));
  EXPECT_EQ(document->chunk_count, 4);

  EXPECT_EQ(index_->size(), 4u);
  EXPECT_TRUE(index_->contains("manual#3"));
  auto chunks = metadata_store_->get_chunks({"manual#1"});
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].begin_offset, 80u);
  EXPECT_EQ(chunks[0].end_offset, 180u);
  EXPECT_EQ(chunks[0].content, text.substr(80, 100));
}

TEST_F(IngestionServiceTest, SameContentIsSkipped) {
  embed_normally();
  EXPECT_CALL(*mock_client_, get_embeddings(_)).Times(1);
  const std::string text = docqa_tests::TestUtilities::create_test_text(150);

  service_->ingest("doc", "doc.pdf", text);
  IngestResult again = service_->ingest("doc", "doc.pdf", text);

  EXPECT_TRUE(again.skipped);
  EXPECT_EQ(again.chunk_count, 2);
  EXPECT_EQ(index_->size(), 2u);
}

TEST_F(IngestionServiceTest, DifferentContentUnderSameIdIsRejected) {
  embed_normally();
  service_->ingest("doc", "doc.pdf", "first version");

  EXPECT_THROW(service_->ingest("doc", "doc.pdf", "second version"), DuplicateIdError);
  EXPECT_EQ(metadata_store_->get_document("doc")->content_hash, sha256_hex("first version"));
}

TEST_F(IngestionServiceTest, EmptyIdIsRejected) {
  EXPECT_CALL(*mock_client_, get_embeddings(_)).Times(0);
  EXPECT_THROW(service_->ingest("", "x.pdf", "text"), InvalidArgumentError);
  EXPECT_THROW(service_->reingest("", "x.pdf", "text"), InvalidArgumentError);
}

TEST_F(IngestionServiceTest, EmptyTextRecordsDocumentWithoutChunks) {
  EXPECT_CALL(*mock_client_, get_embeddings(_)).Times(0);

  IngestResult result = service_->ingest("blank", "", "   \n ");

  EXPECT_EQ(result.chunk_count, 0);
  auto document = metadata_store_->get_document("blank");
  ASSERT_TRUE(document.has_value());
  EXPECT_EQ(document->filename, "blank");
  EXPECT_EQ(index_->size(), 0u);
}

TEST_F(IngestionServiceTest, PageCountFollowsFormFeeds) {
  embed_normally();
  IngestResult result = service_->ingest("paged", "paged.pdf", "page one\fpage two\fpage three");
  EXPECT_EQ(result.page_count, 3);
}

TEST_F(IngestionServiceTest, EmbeddingFailureWritesNothing) {
  EXPECT_CALL(*mock_client_, get_embeddings(_)).WillOnce(Throw(OllamaError("offline")));

  EXPECT_THROW(service_->ingest("doc", "doc.pdf", "some text"), EmbeddingServiceError);

  EXPECT_FALSE(metadata_store_->get_document("doc").has_value());
  EXPECT_EQ(index_->size(), 0u);
}

TEST_F(IngestionServiceTest, IndexFailureRollsBackStore) {
  embed_normally();
  index_->insert("other#0", {1.0f, 0.0f});  // fixes the index at two dimensions

  EXPECT_THROW(service_->ingest("doc", "doc.pdf", "some text"), DimensionMismatchError);

  auto document = metadata_store_->get_document("doc");
  ASSERT_TRUE(document.has_value());
  EXPECT_TRUE(document->deleted);
  EXPECT_TRUE(metadata_store_->list_documents().empty());
  EXPECT_TRUE(metadata_store_->load_all_chunk_vectors().empty());
  EXPECT_EQ(index_->size(), 1u);
  EXPECT_TRUE(index_->contains("other#0"));
}

TEST_F(IngestionServiceTest, FailedIngestCanBeRetried) {
  EXPECT_CALL(*mock_client_, get_embeddings(_))
      .WillOnce(Throw(OllamaError("offline")))
      .WillOnce(Invoke(fake_embeddings));

  EXPECT_THROW(service_->ingest("doc", "doc.pdf", "some text"), EmbeddingServiceError);
  IngestResult result = service_->ingest("doc", "doc.pdf", "some text");

  EXPECT_FALSE(result.skipped);
  EXPECT_EQ(index_->size(), 1u);
}

TEST_F(IngestionServiceTest, ChunkWriteFailureRollsBackIndexAndStore) {
  embed_normally();
  auto store = std::make_shared<::testing::NiceMock<docqa_tests::MockDocumentStore>>();
  IngestionService service(embedding_client_, index_, store, config_);

  EXPECT_CALL(*store, get_document("doc")).WillOnce(Return(std::nullopt));
  EXPECT_CALL(*store, put_document(_)).Times(1);
  EXPECT_CALL(*store, put_chunks(_)).WillOnce(Throw(MetadataStoreError("disk full")));
  // Once before writing chunks, once while rolling back
  EXPECT_CALL(*store, delete_chunks("doc")).Times(2).WillRepeatedly(Return(0));
  EXPECT_CALL(*store, mark_deleted("doc")).Times(1);

  EXPECT_THROW(service.ingest("doc", "doc.pdf", "some text"), MetadataStoreError);
  EXPECT_EQ(index_->size(), 0u);
}

TEST_F(IngestionServiceTest, ReingestReplacesContent) {
  embed_normally();
  service_->ingest("doc", "doc.pdf", docqa_tests::TestUtilities::create_test_text(250));
  ASSERT_EQ(index_->size(), 4u);

  IngestResult result = service_->reingest("doc", "doc-v2.pdf", "short replacement");

  EXPECT_EQ(result.chunk_count, 1);
  EXPECT_FALSE(result.skipped);
  EXPECT_EQ(index_->size(), 1u);
  EXPECT_TRUE(index_->contains("doc#0"));
  EXPECT_FALSE(index_->contains("doc#3"));
  auto document = metadata_store_->get_document("doc");
  ASSERT_TRUE(document.has_value());
  EXPECT_EQ(document->filename, "doc-v2.pdf");
  EXPECT_FALSE(document->deleted);
  EXPECT_EQ(metadata_store_->load_all_chunk_vectors().size(), 1u);
}

TEST_F(IngestionServiceTest, ReingestOfUnknownIdIngests) {
  embed_normally();
  IngestResult result = service_->reingest("fresh", "fresh.pdf", "brand new text");
  EXPECT_EQ(result.chunk_count, 1);
  EXPECT_EQ(index_->size(), 1u);
}

TEST_F(IngestionServiceTest, ConcurrentIngestOfSameIdIsRejected) {
  std::promise<void> entered;
  std::promise<void> release;
  std::shared_future<void> release_future(release.get_future());
  EXPECT_CALL(*mock_client_, get_embeddings(_))
      .WillOnce(Invoke([&](const std::vector<std::string>& texts) {
        entered.set_value();
        release_future.wait();
        return fake_embeddings(texts);
      }));

  auto first = std::async(std::launch::async,
                          [this]() { return service_->ingest("doc", "doc.pdf", "slow text"); });
  entered.get_future().wait();

  EXPECT_THROW(service_->ingest("doc", "doc.pdf", "slow text"), DuplicateIdError);

  release.set_value();
  EXPECT_EQ(first.get().chunk_count, 1);
  EXPECT_EQ(index_->size(), 1u);
}

TEST_F(IngestionServiceTest, DeleteDuringIngestIsRejected) {
  embed_normally();
  auto claims = std::make_shared<DocumentClaims>();
  auto store = std::make_shared<NiceMock<docqa_tests::MockDocumentStore>>();
  IngestionService ingestion(embedding_client_, index_, store, config_, claims);
  DocumentDeleteService deleter(index_, store, claims);

  std::optional<Document> stored;
  ON_CALL(*store, get_document("doc"))
      .WillByDefault(Invoke([&stored](const std::string&) { return stored; }));
  ON_CALL(*store, put_document(_))
      .WillByDefault(Invoke([&stored](const Document& document) { stored = document; }));
  ON_CALL(*store, mark_deleted("doc")).WillByDefault(Invoke([&stored](const std::string&) {
    stored->deleted = true;
  }));

  // Delete lands after the rows are written and before the index insert
  bool delete_rejected = false;
  EXPECT_CALL(*store, put_chunks(_)).WillOnce(Invoke([&](const std::vector<Chunk>&) {
    try {
      deleter.delete_document("doc");
    } catch (const DuplicateIdError&) {
      delete_rejected = true;
    }
  }));

  IngestResult result = ingestion.ingest("doc", "doc.pdf", "some text");

  EXPECT_TRUE(delete_rejected);
  EXPECT_EQ(result.chunk_count, 1);
  EXPECT_FALSE(stored->deleted);
  EXPECT_TRUE(index_->contains("doc#0"));

  // Once the ingest has finished the delete goes through and leaves nothing behind
  EXPECT_TRUE(deleter.delete_document("doc").was_active);
  EXPECT_TRUE(stored->deleted);
  EXPECT_EQ(index_->size(), 0u);
}

TEST_F(IngestionServiceTest, DocumentDeletedBehindItsBackIsRolledBack) {
  embed_normally();
  auto store = std::make_shared<NiceMock<docqa_tests::MockDocumentStore>>();
  IngestionService ingestion(embedding_client_, index_, store, config_);

  std::optional<Document> stored;
  ON_CALL(*store, get_document("doc"))
      .WillByDefault(Invoke([&stored](const std::string&) { return stored; }));
  ON_CALL(*store, put_document(_))
      .WillByDefault(Invoke([&stored](const Document& document) { stored = document; }));
  // Another writer marks the document deleted without taking a claim
  EXPECT_CALL(*store, put_chunks(_)).WillOnce(Invoke([&stored](const std::vector<Chunk>&) {
    stored->deleted = true;
  }));

  EXPECT_THROW(ingestion.ingest("doc", "doc.pdf", "some text"), DuplicateIdError);
  EXPECT_EQ(index_->size(), 0u);
  EXPECT_FALSE(index_->contains("doc#0"));
}

}  // namespace docqa_core
