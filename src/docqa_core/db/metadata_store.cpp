#include "docqa_core/db/metadata_store.hpp"

#include <sqlite3.h>

#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "docqa_core/db/pooled_connection.hpp"
#include "docqa_core/db/transaction.hpp"

namespace docqa_core {

namespace {

const char *error_kind(int primary_code) {
  switch (primary_code) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return "busy_or_locked";
    case SQLITE_CONSTRAINT:
      return "constraint";
    case SQLITE_READONLY:
      return "readonly";
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return "io";
    case SQLITE_CANTOPEN:
      return "cantopen";
    case SQLITE_ERROR:
    case SQLITE_SCHEMA:
      return "schema";
    default:
      return "generic";
  }
}

// "<operation> failed: (<kind>) <sqlite message> [code=.., xcode=..]"
std::string format_db_error(const std::string &operation, const sqlite::sqlite_exception &e) {
  const int code = e.get_code();
  std::string msg = operation + " failed: (" + error_kind(code) + ") " + e.errstr();
  msg += " [code=" + std::to_string(code) + ", xcode=" + std::to_string(e.get_extended_code()) +
         "]";
  return msg;
}

std::vector<char> to_blob(const std::vector<float> &vector) {
  std::vector<char> blob(vector.size() * sizeof(float));
  if (!blob.empty()) {
    std::memcpy(blob.data(), vector.data(), blob.size());
  }
  return blob;
}

std::vector<float> from_blob(const std::vector<char> &blob) {
  std::vector<float> vector(blob.size() / sizeof(float));
  if (!vector.empty()) {
    std::memcpy(vector.data(), blob.data(), vector.size() * sizeof(float));
  }
  return vector;
}

std::string placeholders(size_t count) {
  std::string out;
  for (size_t i = 0; i < count; ++i) {
    out += (i == 0) ? "?" : ",?";
  }
  return out;
}

}  // namespace

MetadataStore::MetadataStore(DatabaseManager &db_manager) : db_manager_(db_manager) {}

std::string MetadataStore::time_point_to_string(const std::chrono::system_clock::time_point &tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_struct = {};
  gmtime_r(&time_t, &tm_struct);
  std::stringstream ss;
  ss << std::put_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

std::chrono::system_clock::time_point MetadataStore::string_to_time_point(
    const std::string &time_str) {
  std::tm tm_struct = {};
  std::stringstream ss(time_str);
  ss >> std::get_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
  if (ss.fail()) {
    throw MetadataStoreError("Failed to parse time string: " + time_str +
                             ". Expected format YYYY-MM-DD HH:MM:SS.");
  }
  // Stored as UTC
  return std::chrono::system_clock::from_time_t(timegm(&tm_struct));
}

void MetadataStore::put_document(const Document &document) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "INSERT INTO documents (id, filename, content_hash, ingested_at, page_count, "
             "chunk_count, deleted) VALUES (?,?,?,?,?,?,0) "
             "ON CONFLICT(id) DO UPDATE SET filename=excluded.filename, "
             "content_hash=excluded.content_hash, ingested_at=excluded.ingested_at, "
             "page_count=excluded.page_count, chunk_count=excluded.chunk_count, deleted=0"
          << document.id << document.filename << document.content_hash
          << time_point_to_string(document.ingested_at) << document.page_count
          << document.chunk_count;
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("put_document", e));
  }
}

std::optional<Document> MetadataStore::get_document(const std::string &document_id) {
  try {
    std::optional<Document> result;
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, filename, content_hash, ingested_at, page_count, chunk_count, deleted "
             "FROM documents WHERE id = ?"
          << document_id >>
        [&](std::string id, std::string filename, std::string content_hash,
            std::string ingested_at, int page_count, int chunk_count, int deleted) {
          Document document;
          document.id = std::move(id);
          document.filename = std::move(filename);
          document.content_hash = std::move(content_hash);
          document.ingested_at = string_to_time_point(ingested_at);
          document.page_count = page_count;
          document.chunk_count = chunk_count;
          document.deleted = deleted != 0;
          result = std::move(document);
        };
    return result;
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("get_document", e));
  }
}

void MetadataStore::mark_deleted(const std::string &document_id) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE documents SET deleted = 1 WHERE id = ?" << document_id;
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("mark_deleted", e));
  }
}

std::vector<Document> MetadataStore::list_documents() {
  std::vector<Document> documents;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, filename, content_hash, ingested_at, page_count, chunk_count "
             "FROM documents WHERE deleted = 0 ORDER BY id" >>
        [&](std::string id, std::string filename, std::string content_hash,
            std::string ingested_at, int page_count, int chunk_count) {
          Document document;
          document.id = std::move(id);
          document.filename = std::move(filename);
          document.content_hash = std::move(content_hash);
          document.ingested_at = string_to_time_point(ingested_at);
          document.page_count = page_count;
          document.chunk_count = chunk_count;
          documents.push_back(std::move(document));
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("list_documents", e));
  }
  return documents;
}

void MetadataStore::put_chunks(const std::vector<Chunk> &chunks) {
  if (chunks.empty()) {
    return;
  }

  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, /*immediate*/ true);
    for (const auto &chunk : chunks) {
      *conn << "INSERT INTO chunks (id, document_id, ordinal, content, begin_offset, "
               "end_offset, vector_blob) VALUES (?,?,?,?,?,?,?)"
            << chunk.id << chunk.document_id << chunk.ordinal << chunk.content
            << static_cast<int64_t>(chunk.begin_offset) << static_cast<int64_t>(chunk.end_offset)
            << to_blob(chunk.vector_embedding);
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("put_chunks", e));
  }
}

std::vector<Chunk> MetadataStore::get_chunks(const std::vector<std::string> &chunk_ids) {
  std::vector<Chunk> chunks;
  if (chunk_ids.empty()) {
    return chunks;
  }

  try {
    PooledConnection conn(db_manager_);
    auto statement = *conn << "SELECT c.id, c.document_id, c.ordinal, c.content, c.begin_offset, "
                              "c.end_offset FROM chunks c JOIN documents d ON d.id = "
                              "c.document_id WHERE d.deleted = 0 AND c.id IN (" +
                                  placeholders(chunk_ids.size()) + ")";
    for (const auto &chunk_id : chunk_ids) {
      statement << chunk_id;
    }
    statement >> [&](std::string id, std::string document_id, int ordinal, std::string content,
                     int64_t begin_offset, int64_t end_offset) {
      Chunk chunk;
      chunk.id = std::move(id);
      chunk.document_id = std::move(document_id);
      chunk.ordinal = ordinal;
      chunk.content = std::move(content);
      chunk.begin_offset = static_cast<size_t>(begin_offset);
      chunk.end_offset = static_cast<size_t>(end_offset);
      chunks.push_back(std::move(chunk));
    };
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("get_chunks", e));
  }
  return chunks;
}

size_t MetadataStore::delete_chunks(const std::string &document_id) {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, /*immediate*/ true);
    int64_t count = 0;
    *conn << "SELECT COUNT(*) FROM chunks WHERE document_id = ?" << document_id >> count;
    *conn << "DELETE FROM chunks WHERE document_id = ?" << document_id;
    tx.commit();
    return static_cast<size_t>(count);
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("delete_chunks", e));
  }
}

std::vector<Chunk> MetadataStore::load_all_chunk_vectors() {
  std::vector<Chunk> chunks;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT c.id, c.document_id, c.ordinal, c.begin_offset, c.end_offset, "
             "c.vector_blob FROM chunks c JOIN documents d ON d.id = c.document_id "
             "WHERE d.deleted = 0 ORDER BY c.rowid" >>
        [&](std::string id, std::string document_id, int ordinal, int64_t begin_offset,
            int64_t end_offset, std::optional<std::vector<char>> vector_blob) {
          Chunk chunk;
          chunk.id = std::move(id);
          chunk.document_id = std::move(document_id);
          chunk.ordinal = ordinal;
          chunk.begin_offset = static_cast<size_t>(begin_offset);
          chunk.end_offset = static_cast<size_t>(end_offset);
          if (vector_blob) {
            chunk.vector_embedding = from_blob(*vector_blob);
          }
          chunks.push_back(std::move(chunk));
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("load_all_chunk_vectors", e));
  }
  return chunks;
}

}  // namespace docqa_core
