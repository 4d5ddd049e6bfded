#pragma once

#include <memory>
#include <string>

#include "docqa_core/chunking/text_chunker.hpp"
#include "docqa_core/db/document_store.hpp"
#include "docqa_core/index/vector_index.hpp"
#include "docqa_core/llm/embedding_client.hpp"
#include "docqa_core/retrieval_config.hpp"
#include "docqa_core/services/document_claims.hpp"

namespace docqa_core {

struct IngestResult {
  std::string document_id;
  int chunk_count = 0;
  int page_count = 0;
  // True when the same content was already ingested under this id.
  bool skipped = false;
};

/**
 * @class IngestionService
 * @brief Chunks, embeds and indexes the extracted text of one document.
 *
 * A document becomes visible to the retriever only once its chunk rows and
 * index entries are all written; a failure part way removes whatever was
 * written and rethrows. The id stays claimed in `claims` for the whole write,
 * so share one DocumentClaims with the DocumentDeleteService.
 */
class IngestionService {
 public:
  IngestionService(std::shared_ptr<EmbeddingClient> embedding_client,
                   std::shared_ptr<VectorIndex> index,
                   std::shared_ptr<DocumentStore> document_store,
                   const RetrievalConfig &config,
                   std::shared_ptr<DocumentClaims> claims = nullptr);

  IngestResult ingest(const std::string &document_id,
                      const std::string &filename,
                      const std::string &raw_text);

  // Replaces whatever is stored under document_id.
  IngestResult reingest(const std::string &document_id,
                        const std::string &filename,
                        const std::string &raw_text);

 private:
  IngestResult ingest_claimed(const std::string &document_id,
                              const std::string &filename,
                              const std::string &raw_text);

  void roll_back(const std::string &document_id);

  std::shared_ptr<EmbeddingClient> embedding_client_;
  std::shared_ptr<VectorIndex> index_;
  std::shared_ptr<DocumentStore> document_store_;
  TextChunker chunker_;
  std::shared_ptr<DocumentClaims> claims_;
};

}  // namespace docqa_core
