#include "docqa_core/generation/token_counter.hpp"

#include <cctype>

namespace docqa_core {

size_t WordPieceTokenCounter::count(std::string_view text) const {
  size_t tokens = 0;
  size_t word_length = 0;

  auto end_word = [&]() {
    tokens += (word_length + kPieceLength - 1) / kPieceLength;
    word_length = 0;
  };

  for (char ch : text) {
    const auto byte = static_cast<unsigned char>(ch);
    if ((byte & 0xC0) == 0x80) {
      // UTF-8 continuation byte, already counted with its lead byte
      continue;
    }
    if (byte >= 0x80 || std::isalnum(byte)) {
      ++word_length;
    } else if (std::ispunct(byte)) {
      end_word();
      ++tokens;
    } else {
      end_word();
    }
  }
  end_word();
  return tokens;
}

}  // namespace docqa_core
