#include "docqa_core/retrieval_config.hpp"

#include <string>

#include "docqa_core/errors.hpp"

namespace docqa_core {

namespace {

void read_int(const nlohmann::json &json_config, const char *key, int &field) {
  if (!json_config.contains(key)) {
    return;
  }
  const auto &value = json_config.at(key);
  if (!value.is_number_integer()) {
    throw ConfigError("RetrievalConfig", std::string(key) + " must be an integer, got " +
                                             value.dump());
  }
  field = value.get<int>();
}

void require(bool condition, const std::string &message) {
  if (!condition) {
    throw ConfigError("RetrievalConfig", message);
  }
}

}  // namespace

RetrievalConfig RetrievalConfig::from_json(const nlohmann::json &json_config) {
  if (!json_config.is_object()) {
    throw ConfigError("RetrievalConfig", "expected a JSON object, got " + json_config.dump());
  }

  RetrievalConfig config;
  read_int(json_config, "chunk_size", config.chunk_size);
  read_int(json_config, "overlap", config.overlap);
  read_int(json_config, "embedding_batch_max", config.embedding_batch_max);
  read_int(json_config, "embedding_max_attempts", config.embedding_max_attempts);
  read_int(json_config, "embedding_retry_base_ms", config.embedding_retry_base_ms);
  read_int(json_config, "embedding_cache_capacity", config.embedding_cache_capacity);
  read_int(json_config, "retrieval_k", config.retrieval_k);
  read_int(json_config, "retrieval_overfetch_factor", config.retrieval_overfetch_factor);
  read_int(json_config, "max_context_tokens", config.max_context_tokens);
  read_int(json_config, "approximate_index_threshold", config.approximate_index_threshold);
  read_int(json_config, "search_width", config.search_width);
  read_int(json_config, "hnsw_m", config.hnsw_m);
  read_int(json_config, "hnsw_ef_construction", config.hnsw_ef_construction);

  config.validate();
  return config;
}

nlohmann::json RetrievalConfig::to_json() const {
  return {{"chunk_size", chunk_size},
          {"overlap", overlap},
          {"embedding_batch_max", embedding_batch_max},
          {"embedding_max_attempts", embedding_max_attempts},
          {"embedding_retry_base_ms", embedding_retry_base_ms},
          {"embedding_cache_capacity", embedding_cache_capacity},
          {"retrieval_k", retrieval_k},
          {"retrieval_overfetch_factor", retrieval_overfetch_factor},
          {"max_context_tokens", max_context_tokens},
          {"approximate_index_threshold", approximate_index_threshold},
          {"search_width", search_width},
          {"hnsw_m", hnsw_m},
          {"hnsw_ef_construction", hnsw_ef_construction}};
}

void RetrievalConfig::validate() const {
  require(chunk_size >= 1, "chunk_size must be at least 1");
  require(overlap >= 0, "overlap cannot be negative");
  require(overlap < chunk_size, "overlap must be smaller than chunk_size");
  require(embedding_batch_max >= 1, "embedding_batch_max must be at least 1");
  require(embedding_max_attempts >= 1 && embedding_max_attempts <= 10,
          "embedding_max_attempts must be between 1 and 10");
  require(embedding_retry_base_ms >= 0, "embedding_retry_base_ms cannot be negative");
  require(embedding_cache_capacity >= 0, "embedding_cache_capacity cannot be negative");
  require(retrieval_k >= 1, "retrieval_k must be at least 1");
  require(retrieval_overfetch_factor >= 1, "retrieval_overfetch_factor must be at least 1");
  require(max_context_tokens >= 1, "max_context_tokens must be at least 1");
  require(approximate_index_threshold >= 1, "approximate_index_threshold must be at least 1");
  require(search_width >= 1, "search_width must be at least 1");
  require(hnsw_m >= 2 && hnsw_m <= 128, "hnsw_m must be between 2 and 128");
  require(hnsw_ef_construction >= 1, "hnsw_ef_construction must be at least 1");
}

}  // namespace docqa_core
