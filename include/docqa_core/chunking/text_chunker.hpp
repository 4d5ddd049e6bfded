#pragma once

#include <cstddef>
#include <iterator>
#include <string>
#include <vector>

namespace docqa_core {

// A passage of the source text and its code-point range [begin, end).
struct TextSpan {
  std::string text;
  size_t begin = 0;
  size_t end = 0;
};

/**
 * @class ChunkSequence
 * @brief Lazy, finite and restartable sequence of overlapping windows over a text.
 *
 * Passages are only materialized while iterating. Every call to begin() starts a
 * fresh traversal that yields the same passages. Iterators are invalidated when
 * the sequence is destroyed.
 */
class ChunkSequence {
 public:
  class iterator {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = TextSpan;
    using difference_type = std::ptrdiff_t;
    using pointer = const TextSpan *;
    using reference = const TextSpan &;

    iterator() = default;

    reference operator*() const {
      return current_;
    }
    pointer operator->() const {
      return &current_;
    }
    iterator &operator++();
    iterator operator++(int);

    bool operator==(const iterator &other) const {
      return owner_ == other.owner_ && start_ == other.start_;
    }
    bool operator!=(const iterator &other) const {
      return !(*this == other);
    }

   private:
    friend class ChunkSequence;
    iterator(const ChunkSequence *owner, size_t start);
    void load();

    const ChunkSequence *owner_ = nullptr;
    size_t start_ = 0;
    TextSpan current_;
  };

  iterator begin() const;
  iterator end() const;

  bool empty() const {
    return unit_count_ == 0;
  }

  // Number of windows the sequence yields, without materializing them.
  size_t size() const;

  // Number of code points in the source text.
  size_t unit_count() const {
    return unit_count_;
  }

  std::vector<TextSpan> to_vector() const;

 private:
  friend class TextChunker;
  ChunkSequence(std::string text, size_t chunk_size, size_t overlap);

  std::string text_;
  // Byte offset of every code point, plus text_.size() as a sentinel.
  std::vector<size_t> byte_offsets_;
  size_t unit_count_ = 0;
  size_t chunk_size_;
  size_t step_;
};

/**
 * @class TextChunker
 * @brief Splits extracted document text into fixed-size overlapping windows.
 *
 * Sizes and offsets are counted in Unicode code points. Windows start every
 * (chunk_size - overlap) code points; the final window may be shorter. Empty
 * or whitespace-only text produces an empty sequence.
 */
class TextChunker {
 public:
  // Throws ConfigError unless chunk_size > 0 and 0 <= overlap < chunk_size.
  TextChunker(int chunk_size, int overlap);

  ChunkSequence chunk(std::string text) const;

  static ChunkSequence chunk(std::string text, int chunk_size, int overlap);

  int chunk_size() const {
    return chunk_size_;
  }
  int overlap() const {
    return overlap_;
  }

 private:
  static void validate(int chunk_size, int overlap);

  int chunk_size_;
  int overlap_;
};

}  // namespace docqa_core
