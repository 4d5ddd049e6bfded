#include "docqa_core/services/answer_service.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "docqa_core/errors.hpp"

namespace docqa_core {

namespace {

std::string trim(const std::string &text) {
  const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  auto begin = std::find_if_not(text.begin(), text.end(), is_space);
  auto end = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
  return begin < end ? std::string(begin, end) : std::string();
}

std::string to_lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

}  // namespace

Answer Answer::could_not_answer(std::string reason) {
  Answer answer;
  answer.text = kNotInContextReply;
  answer.answered = false;
  answer.failure_reason = std::move(reason);
  return answer;
}

AnswerService::AnswerService(std::shared_ptr<OllamaClient> ollama_client,
                             std::shared_ptr<const ContextAssembler> assembler)
    : ollama_client_(std::move(ollama_client)), assembler_(std::move(assembler)) {
  if (!ollama_client_ || !assembler_) {
    throw std::invalid_argument("AnswerService: model client and assembler are required");
  }
}

Answer AnswerService::answer(const std::string &question,
                             const std::vector<RetrievedChunk> &retrieved,
                             size_t max_context_tokens) {
  std::vector<ContextPassage> passages;
  passages.reserve(retrieved.size());
  for (const auto &item : retrieved) {
    passages.push_back({item.chunk.id, item.chunk.document_id, item.chunk.content, item.score});
  }

  AssembledContext context = assembler_->assemble(question, std::move(passages),
                                                  max_context_tokens);
  if (context.included.empty()) {
    Answer unanswered = Answer::could_not_answer(retrieved.empty()
                                                     ? "no relevant passages were found"
                                                     : "no passage fits within the context budget");
    unanswered.model_name = model_name();
    return unanswered;
  }

  std::string raw;
  try {
    raw = ollama_client_->generate(context.prompt);
  } catch (const OllamaError &e) {
    throw GenerationServiceError("generate", e.what());
  }

  Answer result;
  result.model_name = model_name();
  result.text = trim(raw);
  if (result.text.empty()) {
    throw GenerationServiceError("generate", "model returned an empty answer");
  }
  if (to_lower(result.text).find(kNotInContextReply) != std::string::npos) {
    result.answered = false;
    result.failure_reason = "the model found no answer in the retrieved passages";
    return result;
  }

  result.answered = true;
  result.citations = extract_citations(result.text, context.included);
  return result;
}

std::vector<Citation> AnswerService::extract_citations(
    const std::string &answer_text, const std::vector<ContextPassage> &included) {
  std::vector<std::pair<size_t, const ContextPassage *>> referenced;
  for (const auto &passage : included) {
    const size_t position = answer_text.find(ContextAssembler::passage_marker(passage.chunk_id));
    if (position != std::string::npos) {
      referenced.emplace_back(position, &passage);
    }
  }
  std::stable_sort(referenced.begin(), referenced.end(),
                   [](const auto &a, const auto &b) { return a.first < b.first; });

  std::vector<Citation> citations;
  if (referenced.empty()) {
    for (const auto &passage : included) {
      citations.push_back({passage.chunk_id, passage.document_id});
    }
    return citations;
  }
  for (const auto &[position, passage] : referenced) {
    citations.push_back({passage->chunk_id, passage->document_id});
  }
  return citations;
}

}  // namespace docqa_core
