#pragma once

#include <mutex>
#include <string>
#include <unordered_set>
#include <utility>

#include "docqa_core/errors.hpp"

namespace docqa_core {

/**
 * @class DocumentClaims
 * @brief Ids of documents with a write in progress.
 *
 * Ingestion, re-ingestion and deletion of the same id are mutually exclusive:
 * whichever comes second is rejected with DuplicateIdError instead of waiting,
 * so a caller that already holds a claim can never deadlock on its own id.
 */
class DocumentClaims {
 public:
  // Holds the claim on one id until destroyed.
  class Claim {
   public:
    ~Claim() {
      std::lock_guard<std::mutex> lock(owner_.mutex_);
      owner_.claimed_.erase(document_id_);
    }

    Claim(const Claim &) = delete;
    Claim &operator=(const Claim &) = delete;

   private:
    friend class DocumentClaims;
    Claim(DocumentClaims &owner, std::string document_id)
        : owner_(owner), document_id_(std::move(document_id)) {}

    DocumentClaims &owner_;
    std::string document_id_;
  };

  Claim claim(const std::string &operation, const std::string &document_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!claimed_.insert(document_id).second) {
      throw DuplicateIdError(operation, document_id + " has another write in progress");
    }
    return Claim(*this, document_id);
  }

  bool is_claimed(const std::string &document_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return claimed_.count(document_id) != 0;
  }

 private:
  mutable std::mutex mutex_;
  std::unordered_set<std::string> claimed_;
};

}  // namespace docqa_core
