#include "docqa_core/service_context.hpp"

#include <iostream>

#include "docqa_core/errors.hpp"
#include "docqa_core/services/answer_service.hpp"
#include "docqa_core/services/document_delete_service.hpp"
#include "docqa_core/services/ingestion_service.hpp"
#include "docqa_core/services/retriever.hpp"

namespace docqa_core {

ServiceContext::ServiceContext(const ContextSettings &settings,
                               std::shared_ptr<OllamaClient> ollama_client,
                               EmbeddingClient::Sleeper sleeper)
    : settings_(settings), ollama_client_(std::move(ollama_client)) {
  settings_.retrieval.validate();

  db_manager_ = std::make_unique<DatabaseManager>(settings_.metadata_db_path,
                                                  settings_.db_pool_size);
  metadata_store_ = std::make_shared<MetadataStore>(*db_manager_);

  if (!ollama_client_) {
    ollama_client_ = std::make_shared<OllamaClient>(settings_.ollama_url,
                                                    settings_.embedding_model,
                                                    settings_.generation_model,
                                                    settings_.request_timeout_seconds);
  }
  embedding_client_ =
      std::make_shared<EmbeddingClient>(ollama_client_, settings_.retrieval, std::move(sleeper));
  index_ = std::make_shared<VectorIndex>(IndexOptions::from_config(settings_.retrieval));

  load_or_rebuild_index();

  auto claims = std::make_shared<DocumentClaims>();
  auto ingestion_service = std::make_shared<IngestionService>(embedding_client_, index_,
                                                              metadata_store_,
                                                              settings_.retrieval, claims);
  auto delete_service = std::make_shared<DocumentDeleteService>(index_, metadata_store_, claims);
  auto retriever = std::make_shared<Retriever>(embedding_client_, index_, metadata_store_,
                                               settings_.retrieval.retrieval_overfetch_factor);
  auto answer_service = std::make_shared<AnswerService>(ollama_client_);

  QaOptions options;
  options.retrieval_k = settings_.retrieval.retrieval_k;
  options.max_context_tokens = static_cast<size_t>(settings_.retrieval.max_context_tokens);
  options.index_path = settings_.index_path;
  qa_service_ = std::make_shared<QaService>(ingestion_service, delete_service, retriever,
                                            answer_service, index_, metadata_store_, options);
}

ServiceContext::~ServiceContext() {
  shutdown();
}

void ServiceContext::load_or_rebuild_index() {
  std::vector<Chunk> stored = metadata_store_->load_all_chunk_vectors();

  if (std::filesystem::exists(settings_.index_path)) {
    try {
      index_->load(settings_.index_path);
      if (index_->size() == stored.size()) {
        return;
      }
      std::cerr << "[ServiceContext] Saved index has " << index_->size()
                << " entries but the metadata store has " << stored.size()
                << " chunks, rebuilding" << std::endl;
    } catch (const IndexLoadError &e) {
      std::cerr << "[ServiceContext] Saved index unusable (" << e.what()
                << "), rebuilding from the metadata store" << std::endl;
    }
    index_ = std::make_shared<VectorIndex>(IndexOptions::from_config(settings_.retrieval));
  } else {
    std::cout << "[ServiceContext] No saved index at " << settings_.index_path << std::endl;
  }

  rebuild_index_from_store(std::move(stored));
}

void ServiceContext::rebuild_index_from_store(std::vector<Chunk> chunks) {
  if (chunks.empty()) {
    return;
  }

  VectorIndex::Batch batch;
  batch.reserve(chunks.size());
  for (auto &chunk : chunks) {
    batch.emplace_back(std::move(chunk.id), std::move(chunk.vector_embedding));
  }
  index_->insert_batch(batch);
  std::cout << "[ServiceContext] Rebuilt index with " << index_->size() << " entries"
            << std::endl;
  try {
    index_->persist(settings_.index_path);
  } catch (const std::exception &e) {
    std::cerr << "[ServiceContext] Failed to save rebuilt index: " << e.what() << std::endl;
  }
}

void ServiceContext::shutdown() {
  if (is_shut_down_) {
    return;
  }
  is_shut_down_ = true;
  if (qa_service_) {
    qa_service_->persist_index();
  }
  if (db_manager_) {
    db_manager_->shutdown();
  }
  std::cout << "[ServiceContext] Shut down" << std::endl;
}

}  // namespace docqa_core
