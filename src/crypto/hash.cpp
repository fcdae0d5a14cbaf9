// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "crypto/hash.hpp"
#include "util/string_parsing.hpp"
#include <memory>
#include <openssl/evp.h>
#include <stdexcept>

namespace dagsync {
namespace crypto {

Sha256Digest Sha256(const uint8_t *data, size_t size) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                              &EVP_MD_CTX_free);
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }

  Sha256Digest digest{};
  unsigned int length = 0;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), data, size) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1 ||
      length != digest.size()) {
    throw std::runtime_error("SHA-256 digest failed");
  }
  return digest;
}

Sha256Digest Sha256(const std::string &data) {
  return Sha256(reinterpret_cast<const uint8_t *>(data.data()), data.size());
}

std::string Sha256Hex(const std::string &data) {
  Sha256Digest digest = Sha256(data);
  return util::HexStr(digest.data(), digest.size());
}

} // namespace crypto
} // namespace dagsync
