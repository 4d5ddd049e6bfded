#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "docqa_core/generation/context_assembler.hpp"
#include "docqa_core/llm/ollama_client.hpp"
#include "docqa_core/services/retriever.hpp"

namespace docqa_core {

struct Citation {
  std::string chunk_id;
  std::string document_id;
};

struct Answer {
  std::string text;
  std::vector<Citation> citations;
  bool answered = false;
  // Set when answered is false.
  std::string failure_reason;
  // Generation model the answer was produced with. Empty when no model was configured.
  std::string model_name;
  std::chrono::system_clock::time_point answered_at = std::chrono::system_clock::now();

  static Answer could_not_answer(std::string reason);
};

/**
 * @class AnswerService
 * @brief Turns retrieved chunks into a grounded, cited answer.
 *
 * Assembles the context within the token budget and calls the generation model
 * exactly once. Generation failures surface as GenerationServiceError; there
 * is no retry here.
 */
class AnswerService {
 public:
  explicit AnswerService(std::shared_ptr<OllamaClient> ollama_client,
                         std::shared_ptr<const ContextAssembler> assembler =
                             std::make_shared<ContextAssembler>());

  Answer answer(const std::string &question,
                const std::vector<RetrievedChunk> &retrieved,
                size_t max_context_tokens);

  const std::string &model_name() const {
    return ollama_client_->generation_model();
  }

 private:
  static std::vector<Citation> extract_citations(const std::string &answer_text,
                                                 const std::vector<ContextPassage> &included);

  std::shared_ptr<OllamaClient> ollama_client_;
  std::shared_ptr<const ContextAssembler> assembler_;
};

}  // namespace docqa_core
