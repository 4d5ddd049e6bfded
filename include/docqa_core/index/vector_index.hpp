#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "docqa_core/index/hnsw_graph.hpp"
#include "docqa_core/retrieval_config.hpp"

namespace docqa_core {

struct IndexOptions {
  // 0 lets the first insertion (or a load) fix the dimension.
  size_t dimension = 0;
  size_t approximate_threshold = 10000;
  size_t search_width = 64;
  int hnsw_m = 32;
  int hnsw_ef_construction = 100;

  static IndexOptions from_config(const RetrievalConfig &config, size_t dimension = 0);
};

struct IndexSearchResult {
  std::string chunk_id;
  float score;  // cosine similarity
};

/**
 * @class VectorIndex
 * @brief In-memory nearest-neighbour index of chunk embeddings.
 *
 * Vectors are normalized once at insertion and compared by dot product. Below
 * the approximate threshold every query is an exact scan; at or above it a
 * HnswGraph answers queries. Results are always ordered by score descending,
 * then by insertion order.
 *
 * Readers share a lock; insert, delete, persist and load take it exclusively.
 */
class VectorIndex {
 public:
  using Batch = std::vector<std::pair<std::string, std::vector<float>>>;

  explicit VectorIndex(IndexOptions options = {});

  VectorIndex(const VectorIndex &) = delete;
  VectorIndex &operator=(const VectorIndex &) = delete;

  void insert(const std::string &chunk_id, const std::vector<float> &vector);

  // All-or-nothing: a bad entry leaves the index unchanged.
  void insert_batch(const Batch &entries);

  // Number of entries removed; 0 if the document is unknown.
  size_t delete_by_document(const std::string &document_id);

  std::vector<IndexSearchResult> query(const std::vector<float> &vector, int k) const;

  void persist(const std::filesystem::path &path) const;

  // Throws IndexLoadError on a missing or corrupt file; the index is then unchanged.
  void load(const std::filesystem::path &path);

  size_t size() const;
  size_t dimension() const;
  bool contains(const std::string &chunk_id) const;
  bool is_approximate() const;

  void set_search_width(size_t search_width);

 private:
  struct Entry {
    std::string chunk_id;
    std::string document_id;
    uint64_t sequence;
    std::vector<float> vector;
  };

  struct State {
    size_t dimension = 0;
    uint64_t next_sequence = 0;
    std::vector<Entry> entries;  // ascending sequence
    std::unordered_map<std::string, size_t> slot_by_id;
  };

  std::vector<float> prepare_vector(const std::string &operation,
                                    const std::string &chunk_id,
                                    const std::vector<float> &vector,
                                    size_t dimension) const;

  void append_locked(std::string chunk_id, std::vector<float> unit_vector);
  void rebuild_graph_locked();

  std::vector<IndexSearchResult> exact_query_locked(const std::vector<float> &query,
                                                    size_t k) const;
  std::vector<IndexSearchResult> approximate_query_locked(const std::vector<float> &query,
                                                          size_t k) const;

  static State parse_file(const std::string &bytes, const std::filesystem::path &path);

  IndexOptions options_;
  mutable std::shared_mutex mutex_;
  State state_;
  std::unique_ptr<HnswGraph> graph_;  // set while size() >= approximate_threshold
};

}  // namespace docqa_core
