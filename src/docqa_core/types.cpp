#include "docqa_core/types.hpp"

#include <algorithm>

namespace docqa_core {

std::string make_chunk_id(const std::string &document_id, int ordinal) {
  return document_id + "#" + std::to_string(ordinal);
}

std::string document_id_of(const std::string &chunk_id) {
  const auto pos = chunk_id.rfind('#');
  if (pos == std::string::npos) {
    return chunk_id;
  }
  return chunk_id.substr(0, pos);
}

int count_pages(const std::string &text) {
  if (text.empty()) {
    return 0;
  }
  // pdftotext terminates every page, including the last, with a form feed
  const int breaks = static_cast<int>(std::count(text.begin(), text.end(), '\f'));
  return text.back() == '\f' ? breaks : breaks + 1;
}

}  // namespace docqa_core
