#include "docqa_core/db/database_manager.hpp"

#include <stdexcept>

namespace docqa_core {

DatabaseManager::DatabaseManager(const std::filesystem::path& db_path, int pool_size)
    : db_path_(db_path) {
  if (db_path_.has_parent_path()) {
    std::filesystem::create_directories(db_path_.parent_path());
  }

  // Schema first, on a single connection, then the pool
  setup_schema();
  pool_ = std::make_unique<ConnectionPool>(db_path_.string(), pool_size);
  is_open_ = true;
}

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::shutdown() {
  if (!is_open_) {
    return;
  }
  pool_->shutdown();
  is_open_ = false;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (!is_open_) {
    throw std::runtime_error("DatabaseManager has been shut down.");
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (!is_open_) {
    return;
  }
  pool_->return_connection(std::move(conn));
}

void DatabaseManager::setup_schema() {
  sqlite::database db(db_path_.string());
  if (!db.connection()) {
    throw std::runtime_error("Setup: Failed to get native database handle.");
  }
  db << "PRAGMA foreign_keys = ON;";
  db << "PRAGMA journal_mode = WAL;";

  db << R"(
      CREATE TABLE IF NOT EXISTS documents (
          id TEXT PRIMARY KEY,
          filename TEXT NOT NULL,
          content_hash TEXT NOT NULL,
          ingested_at TEXT NOT NULL,
          page_count INTEGER NOT NULL DEFAULT 0,
          chunk_count INTEGER NOT NULL DEFAULT 0,
          deleted INTEGER NOT NULL DEFAULT 0
      )
    )";

  db << R"(
      CREATE TABLE IF NOT EXISTS chunks (
          id TEXT PRIMARY KEY,
          document_id TEXT NOT NULL,
          ordinal INTEGER NOT NULL,
          content TEXT NOT NULL,
          begin_offset INTEGER NOT NULL,
          end_offset INTEGER NOT NULL,
          vector_blob BLOB,
          FOREIGN KEY (document_id) REFERENCES documents(id) ON DELETE CASCADE
      )
    )";

  db << R"(
      CREATE INDEX IF NOT EXISTS idx_chunks_document
      ON chunks(document_id, ordinal)
    )";
}

}  // namespace docqa_core
