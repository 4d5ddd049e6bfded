#include "docqa_core/services/retriever.hpp"

#include <algorithm>
#include <iostream>
#include <limits>
#include <unordered_map>
#include <unordered_set>

#include "docqa_core/errors.hpp"

namespace docqa_core {

Retriever::Retriever(std::shared_ptr<EmbeddingClient> embedding_client,
                     std::shared_ptr<VectorIndex> index,
                     std::shared_ptr<DocumentStore> document_store,
                     int overfetch_factor)
    : embedding_client_(std::move(embedding_client)),
      index_(std::move(index)),
      document_store_(std::move(document_store)),
      overfetch_factor_(overfetch_factor) {
  if (overfetch_factor_ < 1) {
    throw ConfigError("Retriever", "overfetch factor must be at least 1");
  }
}

std::vector<RetrievedChunk> Retriever::retrieve(const std::string &query,
                                                int k,
                                                const RetrievalFilters &filters) {
  if (k <= 0) {
    throw InvalidArgumentError("retrieve", "k must be positive, got " + std::to_string(k));
  }
  if (index_->size() == 0) {
    throw EmptyIndexError("retrieve", "no documents have been ingested");
  }

  // No index lock is held while the model computes the query vector.
  std::vector<float> query_vector = embedding_client_->embed_query(query);

  const long long wanted = std::min<long long>(static_cast<long long>(k) * overfetch_factor_,
                                               std::numeric_limits<int>::max());
  std::vector<IndexSearchResult> hits = index_->query(query_vector, static_cast<int>(wanted));

  std::unordered_set<std::string> allowed(filters.document_ids.begin(),
                                          filters.document_ids.end());
  std::vector<IndexSearchResult> kept;
  std::vector<std::string> chunk_ids;
  for (auto &hit : hits) {
    if (!allowed.empty() && allowed.count(document_id_of(hit.chunk_id)) == 0) {
      continue;
    }
    chunk_ids.push_back(hit.chunk_id);
    kept.push_back(std::move(hit));
  }

  std::unordered_map<std::string, Chunk> chunks_by_id;
  for (auto &chunk : document_store_->get_chunks(chunk_ids)) {
    std::string id = chunk.id;
    chunks_by_id.emplace(std::move(id), std::move(chunk));
  }

  std::vector<RetrievedChunk> results;
  for (const auto &hit : kept) {
    auto it = chunks_by_id.find(hit.chunk_id);
    if (it == chunks_by_id.end()) {
      // Deleted between the index query and the lookup
      continue;
    }
    results.push_back({std::move(it->second), hit.score});
    if (results.size() == static_cast<size_t>(k)) {
      break;
    }
  }
  return results;
}

}  // namespace docqa_core
