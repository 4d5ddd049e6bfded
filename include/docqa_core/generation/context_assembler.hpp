#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "docqa_core/generation/token_counter.hpp"

namespace docqa_core {

// Reply the model is told to give when the context does not contain the answer.
inline constexpr const char *kNotInContextReply = "answer is not available in the context";

struct ContextPassage {
  std::string chunk_id;
  std::string document_id;
  std::string text;
  float score = 0.0f;
};

struct AssembledContext {
  std::string prompt;
  std::vector<ContextPassage> included;  // in prompt order
  size_t token_count = 0;                // passage text only
};

/**
 * @class ContextAssembler
 * @brief Packs the best retrieved passages into a generation prompt.
 *
 * Passages go in by descending score until the next one would push the passage
 * token total past the budget. Each passage is tagged with its chunk id so the
 * answer can cite it.
 */
class ContextAssembler {
 public:
  explicit ContextAssembler(std::shared_ptr<const TokenCounter> token_counter =
                                std::make_shared<WordPieceTokenCounter>());

  AssembledContext assemble(const std::string &question,
                            std::vector<ContextPassage> passages,
                            size_t max_context_tokens) const;

  static std::string passage_marker(const std::string &chunk_id);

 private:
  std::string build_prompt(const std::string &question,
                           const std::vector<ContextPassage> &included) const;

  std::shared_ptr<const TokenCounter> token_counter_;
};

}  // namespace docqa_core
