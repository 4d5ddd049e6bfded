#pragma once

#include <memory>
#include <string>
#include <vector>

#include "docqa_core/db/document_store.hpp"
#include "docqa_core/index/vector_index.hpp"
#include "docqa_core/llm/embedding_client.hpp"
#include "docqa_core/types/chunk.hpp"

namespace docqa_core {

struct RetrievedChunk {
  Chunk chunk;
  float score = 0.0f;
};

struct RetrievalFilters {
  // Restrict results to these documents. Empty means every document.
  std::vector<std::string> document_ids;
};

class Retriever {
 public:
  Retriever(std::shared_ptr<EmbeddingClient> embedding_client,
            std::shared_ptr<VectorIndex> index,
            std::shared_ptr<DocumentStore> document_store,
            int overfetch_factor = 3);

  // Top-k chunks for a natural-language query, best first.
  std::vector<RetrievedChunk> retrieve(const std::string &query,
                                       int k,
                                       const RetrievalFilters &filters = {});

 private:
  std::shared_ptr<EmbeddingClient> embedding_client_;
  std::shared_ptr<VectorIndex> index_;
  std::shared_ptr<DocumentStore> document_store_;
  int overfetch_factor_;
};

}  // namespace docqa_core
