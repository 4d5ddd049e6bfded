#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "docqa_core/db/database_manager.hpp"
#include "docqa_core/db/metadata_store.hpp"
#include "docqa_core/index/vector_index.hpp"
#include "docqa_core/llm/embedding_client.hpp"
#include "docqa_core/llm/ollama_client.hpp"
#include "docqa_core/retrieval_config.hpp"
#include "docqa_core/services/qa_service.hpp"

namespace docqa_core {

struct ContextSettings {
  std::filesystem::path metadata_db_path = "./data/metadata.db";
  std::filesystem::path index_path = "./data/index/vectors.dqvi";
  std::string ollama_url = "http://localhost:11434";
  std::string embedding_model = "mxbai-embed-large";
  std::string generation_model = "llama3.2";
  int request_timeout_seconds = 60;
  int db_pool_size = 4;
  RetrievalConfig retrieval;
};

/**
 * @class ServiceContext
 * @brief Everything a running process shares: storage, model clients, the
 * vector index and the services built on them.
 *
 * Construction opens the database and loads the saved index. A missing or
 * corrupt index file is rebuilt from the vectors kept in the metadata store.
 * shutdown() saves the index and closes the database; the destructor calls it.
 */
class ServiceContext {
 public:
  // ollama_client may be supplied (tests); otherwise one is built from settings.
  explicit ServiceContext(const ContextSettings &settings,
                          std::shared_ptr<OllamaClient> ollama_client = nullptr,
                          EmbeddingClient::Sleeper sleeper = {});
  ~ServiceContext();

  ServiceContext(const ServiceContext &) = delete;
  ServiceContext &operator=(const ServiceContext &) = delete;

  QaService &qa_service() {
    return *qa_service_;
  }
  std::shared_ptr<QaService> get_qa_service() const {
    return qa_service_;
  }
  std::shared_ptr<VectorIndex> get_index() const {
    return index_;
  }
  std::shared_ptr<MetadataStore> get_metadata_store() const {
    return metadata_store_;
  }
  std::shared_ptr<OllamaClient> get_ollama_client() const {
    return ollama_client_;
  }
  const ContextSettings &settings() const {
    return settings_;
  }

  void shutdown();

 private:
  void load_or_rebuild_index();
  void rebuild_index_from_store(std::vector<Chunk> chunks);

  ContextSettings settings_;
  std::unique_ptr<DatabaseManager> db_manager_;
  std::shared_ptr<MetadataStore> metadata_store_;
  std::shared_ptr<OllamaClient> ollama_client_;
  std::shared_ptr<EmbeddingClient> embedding_client_;
  std::shared_ptr<VectorIndex> index_;
  std::shared_ptr<QaService> qa_service_;
  bool is_shut_down_ = false;
};

}  // namespace docqa_core
