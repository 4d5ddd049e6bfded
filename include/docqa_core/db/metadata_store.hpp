#pragma once

#include <sqlite_modern_cpp.h>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "docqa_core/db/database_manager.hpp"
#include "docqa_core/db/document_store.hpp"

namespace docqa_core {

// SQLite-backed DocumentStore. Every call borrows a pooled connection, so one
// instance is safe to share between threads.
class MetadataStore : public DocumentStore {
 public:
  explicit MetadataStore(DatabaseManager &db_manager);

  MetadataStore(const MetadataStore &) = delete;
  MetadataStore &operator=(const MetadataStore &) = delete;

  void put_document(const Document &document) override;
  std::optional<Document> get_document(const std::string &document_id) override;
  void mark_deleted(const std::string &document_id) override;
  std::vector<Document> list_documents() override;

  void put_chunks(const std::vector<Chunk> &chunks) override;
  std::vector<Chunk> get_chunks(const std::vector<std::string> &chunk_ids) override;
  size_t delete_chunks(const std::string &document_id) override;
  std::vector<Chunk> load_all_chunk_vectors() override;

  // Timestamps are stored as "YYYY-MM-DD HH:MM:SS" in UTC.
  static std::string time_point_to_string(const std::chrono::system_clock::time_point &tp);
  static std::chrono::system_clock::time_point string_to_time_point(const std::string &time_str);

 private:
  DatabaseManager &db_manager_;
};

}  // namespace docqa_core
