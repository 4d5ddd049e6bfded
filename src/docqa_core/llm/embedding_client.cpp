#include "docqa_core/llm/embedding_client.hpp"

#include <algorithm>
#include <iostream>
#include <thread>

#include "docqa_core/errors.hpp"
#include "docqa_core/hashing.hpp"
#include "docqa_core/llm/ollama_client.hpp"

namespace docqa_core {

namespace {

std::string indices_to_string(const std::vector<size_t> &indices) {
  std::string out = "[";
  for (size_t i = 0; i < indices.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += std::to_string(indices[i]);
  }
  return out + "]";
}

}  // namespace

EmbeddingClient::EmbeddingClient(std::shared_ptr<OllamaClient> ollama_client,
                                 const RetrievalConfig &config,
                                 Sleeper sleeper)
    : ollama_client_(std::move(ollama_client)),
      batch_max_(static_cast<size_t>(config.embedding_batch_max)),
      max_attempts_(config.embedding_max_attempts),
      retry_base_(config.embedding_retry_base_ms),
      cache_capacity_(static_cast<size_t>(config.embedding_cache_capacity)),
      sleeper_(std::move(sleeper)) {
  if (!ollama_client_) {
    throw ConfigError("EmbeddingClient", "an Ollama client is required");
  }
  config.validate();
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
  }
}

std::vector<std::vector<float>> EmbeddingClient::embed_batch(
    const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> results(texts.size());
  if (texts.empty()) {
    return results;
  }

  // Resolve cache hits first; identical texts inside one call are sent once.
  std::vector<std::string> keys(texts.size());
  std::vector<std::string> pending_texts;
  std::vector<std::string> pending_keys;
  std::unordered_map<std::string, std::vector<size_t>> positions_by_key;
  for (size_t i = 0; i < texts.size(); ++i) {
    keys[i] = sha256_hex(texts[i]);
    if (cache_lookup(keys[i], results[i])) {
      continue;
    }
    auto &positions = positions_by_key[keys[i]];
    if (positions.empty()) {
      pending_texts.push_back(texts[i]);
      pending_keys.push_back(keys[i]);
    }
    positions.push_back(i);
  }

  for (size_t start = 0; start < pending_texts.size(); start += batch_max_) {
    const size_t end = std::min(start + batch_max_, pending_texts.size());
    std::vector<std::string> batch(pending_texts.begin() + start, pending_texts.begin() + end);

    std::vector<size_t> input_indices;
    for (size_t j = start; j < end; ++j) {
      const auto &positions = positions_by_key[pending_keys[j]];
      input_indices.insert(input_indices.end(), positions.begin(), positions.end());
    }
    std::sort(input_indices.begin(), input_indices.end());

    std::vector<std::vector<float>> vectors = call_with_retry(batch, input_indices);
    for (size_t j = start; j < end; ++j) {
      const auto &vector = vectors[j - start];
      cache_store(pending_keys[j], vector);
      for (size_t position : positions_by_key[pending_keys[j]]) {
        results[position] = vector;
      }
    }
  }

  return results;
}

std::vector<float> EmbeddingClient::embed_query(const std::string &text) {
  return embed_batch({text}).front();
}

size_t EmbeddingClient::dimension() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dimension_;
}

size_t EmbeddingClient::cache_size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cache_.size();
}

std::vector<std::vector<float>> EmbeddingClient::call_with_retry(
    const std::vector<std::string> &texts, const std::vector<size_t> &input_indices) {
  std::string last_error;
  for (int attempt = 1; attempt <= max_attempts_; ++attempt) {
    try {
      std::vector<std::vector<float>> vectors = ollama_client_->get_embeddings(texts);
      check_response(vectors, texts.size(), input_indices);
      return vectors;
    } catch (const OllamaResponseError &e) {
      std::cerr << "[EmbeddingClient] Batch " << indices_to_string(input_indices)
                << " got a malformed response: " << e.what() << std::endl;
      throw EmbeddingServiceError("embed_batch",
                                  "malformed response for inputs " +
                                      indices_to_string(input_indices) + ": " + e.what(),
                                  input_indices);
    } catch (const OllamaError &e) {
      last_error = e.what();
      std::cerr << "[EmbeddingClient] Batch " << indices_to_string(input_indices)
                << " failed on attempt " << attempt << "/" << max_attempts_ << ": "
                << last_error << std::endl;
    }
    if (attempt < max_attempts_) {
      // 1x, 2x, 4x ... the base delay
      sleeper_(retry_base_ * (1LL << (attempt - 1)));
    }
  }
  throw EmbeddingServiceError("embed_batch",
                              "gave up after " + std::to_string(max_attempts_) +
                                  " attempts for inputs " + indices_to_string(input_indices) +
                                  ": " + last_error,
                              input_indices);
}

void EmbeddingClient::check_response(const std::vector<std::vector<float>> &vectors,
                                     size_t expected_count,
                                     const std::vector<size_t> &input_indices) {
  if (vectors.size() != expected_count) {
    throw EmbeddingServiceError("embed_batch",
                                "model returned " + std::to_string(vectors.size()) +
                                    " vectors for " + std::to_string(expected_count) + " texts",
                                input_indices);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &vector : vectors) {
    if (vector.empty()) {
      throw EmbeddingServiceError("embed_batch", "model returned an empty vector",
                                  input_indices);
    }
    if (dimension_ == 0) {
      dimension_ = vector.size();
    } else if (vector.size() != dimension_) {
      throw EmbeddingServiceError("embed_batch",
                                  "model returned a vector of length " +
                                      std::to_string(vector.size()) + ", expected " +
                                      std::to_string(dimension_),
                                  input_indices);
    }
  }
}

bool EmbeddingClient::cache_lookup(const std::string &key, std::vector<float> &out) {
  if (cache_capacity_ == 0) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = cache_.find(key);
  if (it == cache_.end()) {
    return false;
  }
  lru_list_.splice(lru_list_.begin(), lru_list_, it->second.lru_it);
  out = it->second.vector;
  return true;
}

void EmbeddingClient::cache_store(const std::string &key, const std::vector<float> &vector) {
  if (cache_capacity_ == 0) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = cache_.find(key);
  if (it != cache_.end()) {
    lru_list_.splice(lru_list_.begin(), lru_list_, it->second.lru_it);
    it->second.vector = vector;
    return;
  }
  if (cache_.size() >= cache_capacity_ && !lru_list_.empty()) {
    cache_.erase(lru_list_.back());
    lru_list_.pop_back();
  }
  lru_list_.push_front(key);
  cache_.emplace(key, CacheEntry{vector, lru_list_.begin()});
}

}  // namespace docqa_core
