#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace docqa_core {

struct Chunk {
  std::string id;
  std::string document_id;
  int ordinal = 0;
  std::string content;
  // Code-point offsets into the source document, half-open.
  size_t begin_offset = 0;
  size_t end_offset = 0;
  std::vector<float> vector_embedding;
};

// Chunk ids are "<document_id>#<ordinal>".
std::string make_chunk_id(const std::string &document_id, int ordinal);

// Document part of a chunk id (everything before the last '#').
std::string document_id_of(const std::string &chunk_id);

}  // namespace docqa_core
