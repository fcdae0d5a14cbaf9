// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// OpenSSL forward declaration (keeps <openssl/evp.h> out of public headers)
typedef struct evp_pkey_st EVP_PKEY;

namespace dagsync {
namespace crypto {

/**
 * ECKey - secp256k1 key pair used to sign and verify DAG nodes
 *
 * Signatures are ECDSA over SHA-256 of the message, DER encoded.
 * Public keys travel as hex of the DER SubjectPublicKeyInfo.
 *
 * Key generation failure throws std::runtime_error. Signing and
 * verification never throw on bad input: Sign() returns an empty vector
 * and Verify() returns false.
 */
class ECKey {
public:
  static ECKey Generate();

  ECKey(ECKey &&) noexcept = default;
  ECKey &operator=(ECKey &&) noexcept = default;
  ECKey(const ECKey &) = delete;
  ECKey &operator=(const ECKey &) = delete;
  ~ECKey() = default;

  [[nodiscard]] std::vector<uint8_t> Sign(const std::string &message) const;

  [[nodiscard]] std::string PublicKeyHex() const;

  [[nodiscard]] static bool Verify(const std::string &public_key_hex,
                                   const std::string &message,
                                   const std::vector<uint8_t> &signature);

private:
  struct PKeyDeleter {
    void operator()(EVP_PKEY *pkey) const;
  };
  using PKeyPtr = std::unique_ptr<EVP_PKEY, PKeyDeleter>;

  explicit ECKey(PKeyPtr pkey);

  PKeyPtr pkey_;
  std::string public_key_hex_;
};

} // namespace crypto
} // namespace dagsync
