#include "docqa_core/hashing.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace docqa_core {

Sha256Digest sha256_digest(std::string_view data) {
  EVP_MD_CTX *mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw std::runtime_error("Failed to create EVP context for hashing");
  }

  if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("Failed to initialize SHA256 digest");
  }

  if (EVP_DigestUpdate(mdctx, data.data(), data.size()) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("Failed to update SHA256 digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (EVP_DigestFinal_ex(mdctx, hash, &hash_len) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("Failed to finalize SHA256 digest");
  }
  EVP_MD_CTX_free(mdctx);

  Sha256Digest digest{};
  if (hash_len != digest.size()) {
    throw std::runtime_error("Unexpected SHA256 digest length: " + std::to_string(hash_len));
  }
  std::copy(hash, hash + hash_len, digest.begin());
  return digest;
}

std::string sha256_hex(std::string_view data) {
  const Sha256Digest digest = sha256_digest(data);
  std::stringstream ss;
  for (unsigned char byte : digest) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return ss.str();
}

}  // namespace docqa_core
