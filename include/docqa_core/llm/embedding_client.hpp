#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "docqa_core/retrieval_config.hpp"

namespace docqa_core {

class OllamaClient;

/**
 * @class EmbeddingClient
 * @brief Batching, retrying and caching front of the embedding model.
 *
 * Inputs larger than the configured batch size are split into several model
 * calls and the results concatenated in input order. Each call is retried with
 * exponential backoff; exhausting the attempts raises EmbeddingServiceError
 * carrying the input positions of the failed batch. Results are cached by the
 * SHA-256 of the exact text in a bounded LRU.
 *
 * Thread-safe. No lock is held while a model call is in flight.
 */
class EmbeddingClient {
 public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  EmbeddingClient(std::shared_ptr<OllamaClient> ollama_client,
                  const RetrievalConfig &config,
                  Sleeper sleeper = {});

  EmbeddingClient(const EmbeddingClient &) = delete;
  EmbeddingClient &operator=(const EmbeddingClient &) = delete;

  std::vector<std::vector<float>> embed_batch(const std::vector<std::string> &texts);

  std::vector<float> embed_query(const std::string &text);

  // Vector length observed on the first successful call, 0 before that.
  size_t dimension() const;

  size_t cache_size() const;

 private:
  struct CacheEntry {
    std::vector<float> vector;
    std::list<std::string>::iterator lru_it;
  };

  std::vector<std::vector<float>> call_with_retry(const std::vector<std::string> &texts,
                                                  const std::vector<size_t> &input_indices);
  void check_response(const std::vector<std::vector<float>> &vectors,
                      size_t expected_count,
                      const std::vector<size_t> &input_indices);

  bool cache_lookup(const std::string &key, std::vector<float> &out);
  void cache_store(const std::string &key, const std::vector<float> &vector);

  std::shared_ptr<OllamaClient> ollama_client_;
  size_t batch_max_;
  int max_attempts_;
  std::chrono::milliseconds retry_base_;
  size_t cache_capacity_;
  Sleeper sleeper_;

  mutable std::mutex mutex_;
  size_t dimension_ = 0;
  std::list<std::string> lru_list_;
  std::unordered_map<std::string, CacheEntry> cache_;
};

}  // namespace docqa_core
