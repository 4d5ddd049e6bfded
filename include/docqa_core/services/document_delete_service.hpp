#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "docqa_core/db/document_store.hpp"
#include "docqa_core/index/vector_index.hpp"
#include "docqa_core/services/document_claims.hpp"

namespace docqa_core {

struct DeleteResult {
  // An active document with that id existed.
  bool was_active = false;
  size_t index_entries_removed = 0;
  size_t chunks_removed = 0;

  bool changed() const {
    return was_active || index_entries_removed > 0 || chunks_removed > 0;
  }
};

class DocumentDeleteService {
 public:
  DocumentDeleteService(std::shared_ptr<VectorIndex> index,
                        std::shared_ptr<DocumentStore> document_store,
                        std::shared_ptr<DocumentClaims> claims = nullptr);

  // Removes a document's index entries and chunk rows and marks it deleted.
  // Throws DuplicateIdError while another write to the same id is in progress.
  DeleteResult delete_document(const std::string &document_id);

 private:
  std::shared_ptr<VectorIndex> index_;
  std::shared_ptr<DocumentStore> document_store_;
  std::shared_ptr<DocumentClaims> claims_;
};

}  // namespace docqa_core
