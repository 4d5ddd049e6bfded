#pragma once

#include <cstddef>
#include <string_view>

namespace docqa_core {

// Estimates how many model tokens a piece of text costs.
class TokenCounter {
 public:
  virtual ~TokenCounter() = default;
  virtual size_t count(std::string_view text) const = 0;
};

/**
 * WordPiece-style estimate without a vocabulary: each run of word characters
 * costs one token per started group of four code points, each ASCII
 * punctuation character costs one token, whitespace is free. Non-ASCII code
 * points count as word characters.
 */
class WordPieceTokenCounter : public TokenCounter {
 public:
  static constexpr size_t kPieceLength = 4;

  size_t count(std::string_view text) const override;
};

}  // namespace docqa_core
