#include "docqa_core/services/qa_service.hpp"

#include <iostream>
#include <system_error>

#include "docqa_core/errors.hpp"

namespace docqa_core {

QaService::QaService(std::shared_ptr<IngestionService> ingestion_service,
                     std::shared_ptr<DocumentDeleteService> delete_service,
                     std::shared_ptr<Retriever> retriever,
                     std::shared_ptr<AnswerService> answer_service,
                     std::shared_ptr<VectorIndex> index,
                     std::shared_ptr<DocumentStore> document_store,
                     QaOptions options)
    : ingestion_service_(std::move(ingestion_service)),
      delete_service_(std::move(delete_service)),
      retriever_(std::move(retriever)),
      answer_service_(std::move(answer_service)),
      index_(std::move(index)),
      document_store_(std::move(document_store)),
      options_(std::move(options)) {}

IngestResult QaService::ingest(const std::string &document_id,
                               const std::string &filename,
                               const std::string &raw_text) {
  IngestResult result = ingestion_service_->ingest(document_id, filename, raw_text);
  if (!result.skipped) {
    persist_index();
  }
  return result;
}

IngestResult QaService::reingest(const std::string &document_id,
                                 const std::string &filename,
                                 const std::string &raw_text) {
  IngestResult result = ingestion_service_->reingest(document_id, filename, raw_text);
  persist_index();
  return result;
}

bool QaService::delete_document(const std::string &document_id) {
  const DeleteResult result = delete_service_->delete_document(document_id);
  if (result.changed()) {
    persist_index();
  }
  return result.was_active;
}

Answer QaService::retrieve_and_answer(const std::string &question,
                                      std::optional<int> k,
                                      const RetrievalFilters &filters) {
  if (question.find_first_not_of(" \t\r\n") == std::string::npos) {
    throw InvalidArgumentError("retrieve_and_answer", "question must not be empty");
  }

  try {
    std::vector<RetrievedChunk> retrieved =
        retriever_->retrieve(question, k.value_or(options_.retrieval_k), filters);
    return answer_service_->answer(question, retrieved, options_.max_context_tokens);
  } catch (const EmbeddingServiceError &e) {
    std::cerr << "[QaService] Embedding failed: " << e.what() << std::endl;
    Answer answer =
        Answer::could_not_answer(std::string("embedding service unavailable: ") + e.what());
    answer.model_name = generation_model();
    return answer;
  } catch (const GenerationServiceError &e) {
    std::cerr << "[QaService] Generation failed: " << e.what() << std::endl;
    Answer answer =
        Answer::could_not_answer(std::string("generation service unavailable: ") + e.what());
    answer.model_name = generation_model();
    return answer;
  }
}

const std::string &QaService::generation_model() const {
  return answer_service_->model_name();
}

std::vector<Document> QaService::list_documents() {
  return document_store_->list_documents();
}

IndexStats QaService::index_stats() const {
  IndexStats stats;
  stats.entry_count = index_->size();
  stats.dimension = index_->dimension();
  stats.approximate = index_->is_approximate();
  if (!options_.index_path.empty()) {
    std::error_code ec;
    const auto bytes = std::filesystem::file_size(options_.index_path, ec);
    if (!ec) {
      stats.on_disk_bytes = bytes;
    }
  }
  return stats;
}

bool QaService::persist_index() {
  if (options_.index_path.empty()) {
    return false;
  }
  try {
    index_->persist(options_.index_path);
    return true;
  } catch (const std::exception &e) {
    std::cerr << "[QaService] Failed to persist index to " << options_.index_path << ": "
              << e.what() << std::endl;
    return false;
  }
}

}  // namespace docqa_core
