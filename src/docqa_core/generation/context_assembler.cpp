#include "docqa_core/generation/context_assembler.hpp"

#include <algorithm>
#include <stdexcept>

namespace docqa_core {

ContextAssembler::ContextAssembler(std::shared_ptr<const TokenCounter> token_counter)
    : token_counter_(std::move(token_counter)) {
  if (!token_counter_) {
    throw std::invalid_argument("ContextAssembler: token counter is required");
  }
}

std::string ContextAssembler::passage_marker(const std::string &chunk_id) {
  return "[" + chunk_id + "]";
}

AssembledContext ContextAssembler::assemble(const std::string &question,
                                            std::vector<ContextPassage> passages,
                                            size_t max_context_tokens) const {
  std::stable_sort(passages.begin(), passages.end(),
                   [](const ContextPassage &a, const ContextPassage &b) {
                     return a.score > b.score;
                   });

  AssembledContext context;
  for (auto &passage : passages) {
    const size_t cost = token_counter_->count(passage.text);
    if (context.token_count + cost > max_context_tokens) {
      break;
    }
    context.token_count += cost;
    context.included.push_back(std::move(passage));
  }

  if (!context.included.empty()) {
    context.prompt = build_prompt(question, context.included);
  }
  return context;
}

std::string ContextAssembler::build_prompt(const std::string &question,
                                           const std::vector<ContextPassage> &included) const {
  std::string prompt =
      "Answer the question as thoroughly as possible using only the context below.\n"
      "If the answer is not in the context, reply exactly: \"";
  prompt += kNotInContextReply;
  prompt +=
      "\".\n"
      "Cite the passages you used by their bracketed markers, for example [report#0].\n\n"
      "Context:\n";
  for (const auto &passage : included) {
    prompt += passage_marker(passage.chunk_id);
    prompt += "\n";
    prompt += passage.text;
    prompt += "\n\n";
  }
  prompt += "Question:\n";
  prompt += question;
  prompt += "\n\nAnswer:\n";
  return prompt;
}

}  // namespace docqa_core
