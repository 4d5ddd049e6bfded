#pragma once

#include <nlohmann/json.hpp>

namespace docqa_core {

// Tuning knobs of the retrieval engine. Every field has a default; from_json()
// fills missing keys with it and validate() enforces the documented ranges.
struct RetrievalConfig {
  // Chunker, in code points
  int chunk_size = 1000;
  int overlap = 100;

  // Embedding adapter
  int embedding_batch_max = 32;
  int embedding_max_attempts = 3;
  int embedding_retry_base_ms = 200;
  int embedding_cache_capacity = 4096;

  // Retriever
  int retrieval_k = 5;
  int retrieval_overfetch_factor = 3;

  // Context assembly
  int max_context_tokens = 3000;

  // Vector index. The graph index takes over once the entry count reaches the threshold.
  int approximate_index_threshold = 10000;
  int search_width = 64;
  int hnsw_m = 32;
  int hnsw_ef_construction = 100;

  static RetrievalConfig from_json(const nlohmann::json &json_config);
  nlohmann::json to_json() const;

  // Throws ConfigError naming the first offending key.
  void validate() const;
};

}  // namespace docqa_core
