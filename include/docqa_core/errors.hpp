#pragma once

#include <cstddef>
#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace docqa_core {

// Base for every error raised by the retrieval engine. Carries the failing
// operation and a detail string (offending id, argument or underlying cause).
class DocqaError : public std::exception {
 public:
  DocqaError(std::string operation, std::string detail)
      : operation_(std::move(operation)),
        detail_(std::move(detail)),
        message_(operation_ + ": " + detail_) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

  const std::string &operation() const noexcept {
    return operation_;
  }

  const std::string &detail() const noexcept {
    return detail_;
  }

 private:
  std::string operation_;
  std::string detail_;
  std::string message_;
};

// Bad configuration or chunking parameters. Fatal to the call.
class ConfigError : public DocqaError {
 public:
  using DocqaError::DocqaError;
};

class DimensionMismatchError : public DocqaError {
 public:
  using DocqaError::DocqaError;
};

class DuplicateIdError : public DocqaError {
 public:
  using DocqaError::DocqaError;
};

class InvalidArgumentError : public DocqaError {
 public:
  using DocqaError::DocqaError;
};

// The embedding model failed after the retry budget, or answered with a malformed payload.
class EmbeddingServiceError : public DocqaError {
 public:
  EmbeddingServiceError(std::string operation,
                        std::string detail,
                        std::vector<size_t> batch_indices = {})
      : DocqaError(std::move(operation), std::move(detail)),
        batch_indices_(std::move(batch_indices)) {}

  // Positions (in the caller's input) of the texts that could not be embedded.
  const std::vector<size_t> &batch_indices() const noexcept {
    return batch_indices_;
  }

 private:
  std::vector<size_t> batch_indices_;
};

class GenerationServiceError : public DocqaError {
 public:
  using DocqaError::DocqaError;
};

// Missing or corrupt persisted index. The in-memory index is left untouched.
class IndexLoadError : public DocqaError {
 public:
  using DocqaError::DocqaError;
};

// Nothing has been ingested yet.
class EmptyIndexError : public DocqaError {
 public:
  using DocqaError::DocqaError;
};

}  // namespace docqa_core
