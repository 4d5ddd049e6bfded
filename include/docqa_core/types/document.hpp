#pragma once

#include <chrono>
#include <string>

namespace docqa_core {

struct Document {
  std::string id;
  std::string filename;
  std::string content_hash;
  std::chrono::system_clock::time_point ingested_at;
  int page_count = 0;
  int chunk_count = 0;
  bool deleted = false;
};

// Extracted PDF text separates pages with form feeds.
int count_pages(const std::string &text);

}  // namespace docqa_core
