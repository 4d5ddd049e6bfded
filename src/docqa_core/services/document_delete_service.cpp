#include "docqa_core/services/document_delete_service.hpp"

#include <iostream>

namespace docqa_core {

DocumentDeleteService::DocumentDeleteService(std::shared_ptr<VectorIndex> index,
                                             std::shared_ptr<DocumentStore> document_store,
                                             std::shared_ptr<DocumentClaims> claims)
    : index_(std::move(index)),
      document_store_(std::move(document_store)),
      claims_(claims ? std::move(claims) : std::make_shared<DocumentClaims>()) {}

DeleteResult DocumentDeleteService::delete_document(const std::string &document_id) {
  auto claim = claims_->claim("delete_document", document_id);

  DeleteResult result;
  const auto existing = document_store_->get_document(document_id);
  result.was_active = existing.has_value() && !existing->deleted;

  // Index first so retrieval stops returning the document before its rows go.
  result.index_entries_removed = index_->delete_by_document(document_id);
  result.chunks_removed = document_store_->delete_chunks(document_id);
  if (existing) {
    document_store_->mark_deleted(document_id);
  }

  if (result.changed()) {
    std::cout << "[DocumentDelete] Deleted '" << document_id << "' ("
              << result.index_entries_removed << " index entries, " << result.chunks_removed
              << " chunks)" << std::endl;
  }
  return result;
}

}  // namespace docqa_core
