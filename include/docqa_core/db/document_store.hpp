#pragma once

#include <cstddef>
#include <exception>
#include <optional>
#include <string>
#include <vector>

#include "docqa_core/types/chunk.hpp"
#include "docqa_core/types/document.hpp"

namespace docqa_core {

class MetadataStoreError : public std::exception {
 public:
  explicit MetadataStoreError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class DocumentStore
 * @brief Durable record of ingested documents and the provenance of their chunks.
 *
 * The vector index only knows chunk ids; the store maps them back to text and
 * offsets, and keeps the raw vectors so the index can be rebuilt without
 * calling the embedding model again.
 */
class DocumentStore {
 public:
  virtual ~DocumentStore() = default;

  // Inserts or replaces the document row. Clears the deleted flag.
  virtual void put_document(const Document &document) = 0;

  // Returns the row even when it is marked deleted.
  virtual std::optional<Document> get_document(const std::string &document_id) = 0;

  virtual void mark_deleted(const std::string &document_id) = 0;

  // Active documents only, ordered by id.
  virtual std::vector<Document> list_documents() = 0;

  virtual void put_chunks(const std::vector<Chunk> &chunks) = 0;

  // Chunks of active documents among chunk_ids, without their vectors. Unknown
  // ids are skipped.
  virtual std::vector<Chunk> get_chunks(const std::vector<std::string> &chunk_ids) = 0;

  // Number of chunk rows removed.
  virtual size_t delete_chunks(const std::string &document_id) = 0;

  // Every chunk of an active document with its vector, in the order written.
  virtual std::vector<Chunk> load_all_chunk_vectors() = 0;
};

}  // namespace docqa_core
