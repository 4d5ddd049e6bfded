#include "docqa_core/chunking/text_chunker.hpp"

#include <utf8.h>

#include <algorithm>
#include <cctype>

#include "docqa_core/errors.hpp"

namespace docqa_core {

namespace {

bool is_blank(const std::string &text) {
  return std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isspace(c) != 0; });
}

// Byte offset of each code point. Bytes that do not start a valid UTF-8
// sequence count as one unit each so arbitrary input is never rejected.
std::vector<size_t> code_point_offsets(const std::string &text) {
  std::vector<size_t> offsets;
  offsets.reserve(text.size() + 1);

  auto it = text.begin();
  while (it != text.end()) {
    offsets.push_back(static_cast<size_t>(it - text.begin()));
    auto next = it;
    try {
      utf8::next(next, text.end());
    } catch (const utf8::exception &) {
      next = it + 1;
    }
    it = next;
  }
  offsets.push_back(text.size());
  return offsets;
}

}  // namespace

// --- ChunkSequence ---

ChunkSequence::ChunkSequence(std::string text, size_t chunk_size, size_t overlap)
    : text_(std::move(text)), chunk_size_(chunk_size), step_(chunk_size - overlap) {
  if (is_blank(text_)) {
    text_.clear();
    byte_offsets_ = {0};
    unit_count_ = 0;
    return;
  }
  byte_offsets_ = code_point_offsets(text_);
  unit_count_ = byte_offsets_.size() - 1;
}

ChunkSequence::iterator ChunkSequence::begin() const {
  return iterator(this, 0);
}

ChunkSequence::iterator ChunkSequence::end() const {
  return iterator(this, unit_count_);
}

size_t ChunkSequence::size() const {
  if (unit_count_ == 0) {
    return 0;
  }
  return (unit_count_ + step_ - 1) / step_;
}

std::vector<TextSpan> ChunkSequence::to_vector() const {
  std::vector<TextSpan> spans;
  spans.reserve(size());
  for (const auto &span : *this) {
    spans.push_back(span);
  }
  return spans;
}

// --- ChunkSequence::iterator ---

ChunkSequence::iterator::iterator(const ChunkSequence *owner, size_t start)
    : owner_(owner), start_(start) {
  load();
}

void ChunkSequence::iterator::load() {
  if (start_ >= owner_->unit_count_) {
    start_ = owner_->unit_count_;
    current_ = TextSpan{};
    return;
  }
  const size_t end = std::min(start_ + owner_->chunk_size_, owner_->unit_count_);
  const size_t byte_begin = owner_->byte_offsets_[start_];
  const size_t byte_end = owner_->byte_offsets_[end];
  current_.text = owner_->text_.substr(byte_begin, byte_end - byte_begin);
  current_.begin = start_;
  current_.end = end;
}

ChunkSequence::iterator &ChunkSequence::iterator::operator++() {
  start_ += owner_->step_;
  load();
  return *this;
}

ChunkSequence::iterator ChunkSequence::iterator::operator++(int) {
  iterator previous = *this;
  ++(*this);
  return previous;
}

// --- TextChunker ---

TextChunker::TextChunker(int chunk_size, int overlap)
    : chunk_size_(chunk_size), overlap_(overlap) {
  validate(chunk_size, overlap);
}

ChunkSequence TextChunker::chunk(std::string text) const {
  return ChunkSequence(std::move(text), static_cast<size_t>(chunk_size_),
                       static_cast<size_t>(overlap_));
}

ChunkSequence TextChunker::chunk(std::string text, int chunk_size, int overlap) {
  validate(chunk_size, overlap);
  return ChunkSequence(std::move(text), static_cast<size_t>(chunk_size),
                       static_cast<size_t>(overlap));
}

void TextChunker::validate(int chunk_size, int overlap) {
  if (chunk_size <= 0) {
    throw ConfigError("chunk", "chunk_size must be positive, got " + std::to_string(chunk_size));
  }
  if (overlap < 0) {
    throw ConfigError("chunk", "overlap cannot be negative, got " + std::to_string(overlap));
  }
  if (overlap >= chunk_size) {
    throw ConfigError("chunk", "overlap (" + std::to_string(overlap) +
                                   ") must be smaller than chunk_size (" +
                                   std::to_string(chunk_size) + ")");
  }
}

}  // namespace docqa_core
