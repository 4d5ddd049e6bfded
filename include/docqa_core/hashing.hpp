#pragma once

#include <array>
#include <string>
#include <string_view>

namespace docqa_core {

using Sha256Digest = std::array<unsigned char, 32>;

// SHA-256 through OpenSSL's EVP interface.
Sha256Digest sha256_digest(std::string_view data);

// Lowercase hex encoding of sha256_digest(data).
std::string sha256_hex(std::string_view data);

}  // namespace docqa_core
