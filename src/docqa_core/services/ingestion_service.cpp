#include "docqa_core/services/ingestion_service.hpp"

#include <chrono>
#include <iostream>
#include <utility>
#include <vector>

#include "docqa_core/errors.hpp"
#include "docqa_core/hashing.hpp"
#include "docqa_core/types/document.hpp"

namespace docqa_core {

IngestionService::IngestionService(std::shared_ptr<EmbeddingClient> embedding_client,
                                   std::shared_ptr<VectorIndex> index,
                                   std::shared_ptr<DocumentStore> document_store,
                                   const RetrievalConfig &config,
                                   std::shared_ptr<DocumentClaims> claims)
    : embedding_client_(std::move(embedding_client)),
      index_(std::move(index)),
      document_store_(std::move(document_store)),
      chunker_(config.chunk_size, config.overlap),
      claims_(claims ? std::move(claims) : std::make_shared<DocumentClaims>()) {}

IngestResult IngestionService::ingest(const std::string &document_id,
                                      const std::string &filename,
                                      const std::string &raw_text) {
  if (document_id.empty()) {
    throw InvalidArgumentError("ingest", "document id must not be empty");
  }
  auto claim = claims_->claim("ingest", document_id);
  return ingest_claimed(document_id, filename, raw_text);
}

IngestResult IngestionService::reingest(const std::string &document_id,
                                        const std::string &filename,
                                        const std::string &raw_text) {
  if (document_id.empty()) {
    throw InvalidArgumentError("reingest", "document id must not be empty");
  }
  auto claim = claims_->claim("reingest", document_id);

  const size_t removed = index_->delete_by_document(document_id);
  document_store_->delete_chunks(document_id);
  document_store_->mark_deleted(document_id);
  std::cout << "[Ingestion] Cleared " << removed << " index entries of '" << document_id
            << "' for re-ingestion" << std::endl;

  return ingest_claimed(document_id, filename, raw_text);
}

IngestResult IngestionService::ingest_claimed(const std::string &document_id,
                                              const std::string &filename,
                                              const std::string &raw_text) {
  const std::string content_hash = sha256_hex(raw_text);

  if (auto existing = document_store_->get_document(document_id);
      existing && !existing->deleted) {
    if (existing->content_hash == content_hash) {
      std::cout << "[Ingestion] '" << document_id << "' is unchanged, skipping" << std::endl;
      return {document_id, existing->chunk_count, existing->page_count, true};
    }
    throw DuplicateIdError("ingest", document_id + " already exists with different content");
  }

  std::vector<Chunk> chunks;
  std::vector<std::string> texts;
  int ordinal = 0;
  for (const TextSpan &span : chunker_.chunk(raw_text)) {
    Chunk chunk;
    chunk.id = make_chunk_id(document_id, ordinal);
    chunk.document_id = document_id;
    chunk.ordinal = ordinal;
    chunk.content = span.text;
    chunk.begin_offset = span.begin;
    chunk.end_offset = span.end;
    texts.push_back(span.text);
    chunks.push_back(std::move(chunk));
    ++ordinal;
  }

  // Nothing is written until every chunk has a vector.
  if (!texts.empty()) {
    std::vector<std::vector<float>> vectors = embedding_client_->embed_batch(texts);
    for (size_t i = 0; i < chunks.size(); ++i) {
      chunks[i].vector_embedding = std::move(vectors[i]);
    }
  }

  Document document;
  document.id = document_id;
  document.filename = filename.empty() ? document_id : filename;
  document.content_hash = content_hash;
  document.ingested_at = std::chrono::system_clock::now();
  document.page_count = count_pages(raw_text);
  document.chunk_count = static_cast<int>(chunks.size());

  try {
    document_store_->put_document(document);
    // Rows left over from an earlier, deleted version would collide on id.
    document_store_->delete_chunks(document_id);
    document_store_->put_chunks(chunks);

    VectorIndex::Batch batch;
    batch.reserve(chunks.size());
    for (const auto &chunk : chunks) {
      batch.emplace_back(chunk.id, chunk.vector_embedding);
    }
    index_->insert_batch(batch);

    // A writer that bypassed the claims may have removed the document meanwhile.
    auto stored = document_store_->get_document(document_id);
    if (!stored || stored->deleted) {
      throw DuplicateIdError("ingest", document_id + " was deleted while being ingested");
    }
  } catch (const std::exception &e) {
    std::cerr << "[Ingestion] Failed to ingest '" << document_id << "': " << e.what()
              << std::endl;
    roll_back(document_id);
    throw;
  }

  std::cout << "[Ingestion] Ingested '" << document_id << "' (" << document.chunk_count
            << " chunks, " << document.page_count << " pages)" << std::endl;
  return {document_id, document.chunk_count, document.page_count, false};
}

void IngestionService::roll_back(const std::string &document_id) {
  try {
    index_->delete_by_document(document_id);
    document_store_->delete_chunks(document_id);
    document_store_->mark_deleted(document_id);
  } catch (const std::exception &e) {
    std::cerr << "[Ingestion] Rollback of '" << document_id << "' incomplete: " << e.what()
              << std::endl;
  }
}

}  // namespace docqa_core
