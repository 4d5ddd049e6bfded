#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "docqa_core/db/document_store.hpp"
#include "docqa_core/index/vector_index.hpp"
#include "docqa_core/services/answer_service.hpp"
#include "docqa_core/services/document_delete_service.hpp"
#include "docqa_core/services/ingestion_service.hpp"
#include "docqa_core/services/retriever.hpp"

namespace docqa_core {

struct IndexStats {
  size_t entry_count = 0;
  size_t dimension = 0;
  uint64_t on_disk_bytes = 0;
  bool approximate = false;
};

struct QaOptions {
  int retrieval_k = 5;
  size_t max_context_tokens = 3000;
  // Where the index is saved after every change. Empty disables saving.
  std::filesystem::path index_path;
};

/**
 * @class QaService
 * @brief Entry point for ingesting documents and asking questions about them.
 *
 * Model failures while answering become an Answer with answered == false and a
 * reason; an empty corpus raises EmptyIndexError and bad arguments raise
 * InvalidArgumentError.
 */
class QaService {
 public:
  QaService(std::shared_ptr<IngestionService> ingestion_service,
            std::shared_ptr<DocumentDeleteService> delete_service,
            std::shared_ptr<Retriever> retriever,
            std::shared_ptr<AnswerService> answer_service,
            std::shared_ptr<VectorIndex> index,
            std::shared_ptr<DocumentStore> document_store,
            QaOptions options);

  IngestResult ingest(const std::string &document_id,
                      const std::string &filename,
                      const std::string &raw_text);

  IngestResult reingest(const std::string &document_id,
                        const std::string &filename,
                        const std::string &raw_text);

  // True when an active document was deleted. The index is saved whenever
  // anything was removed, stray index entries included.
  bool delete_document(const std::string &document_id);

  Answer retrieve_and_answer(const std::string &question,
                             std::optional<int> k = std::nullopt,
                             const RetrievalFilters &filters = {});

  std::vector<Document> list_documents();

  IndexStats index_stats() const;

  // Model named on answers, including could-not-answer ones.
  const std::string &generation_model() const;

  // Writes the index to index_path. Failures are logged, not thrown.
  bool persist_index();

 private:
  std::shared_ptr<IngestionService> ingestion_service_;
  std::shared_ptr<DocumentDeleteService> delete_service_;
  std::shared_ptr<Retriever> retriever_;
  std::shared_ptr<AnswerService> answer_service_;
  std::shared_ptr<VectorIndex> index_;
  std::shared_ptr<DocumentStore> document_store_;
  QaOptions options_;
};

}  // namespace docqa_core
