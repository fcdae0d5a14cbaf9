// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "crypto/ec_key.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/x509.h>
#include <stdexcept>

namespace dagsync {
namespace crypto {

namespace {

std::string LastOpenSSLError() {
  unsigned long code = ERR_get_error();
  if (code == 0) {
    return "unknown error";
  }
  char buf[256];
  ERR_error_string_n(code, buf, sizeof(buf));
  return buf;
}

using MDCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

} // namespace

void ECKey::PKeyDeleter::operator()(EVP_PKEY *pkey) const { EVP_PKEY_free(pkey); }

ECKey::ECKey(PKeyPtr pkey) : pkey_(std::move(pkey)) {
  unsigned char *der = nullptr;
  int len = i2d_PUBKEY(pkey_.get(), &der);
  if (len <= 0 || der == nullptr) {
    throw std::runtime_error("i2d_PUBKEY failed: " + LastOpenSSLError());
  }
  public_key_hex_ = util::HexStr(der, static_cast<size_t>(len));
  OPENSSL_free(der);
}

ECKey ECKey::Generate() {
  std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(
      EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr), &EVP_PKEY_CTX_free);
  if (!ctx) {
    throw std::runtime_error("EVP_PKEY_CTX_new_id failed: " + LastOpenSSLError());
  }
  if (EVP_PKEY_keygen_init(ctx.get()) <= 0 ||
      EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx.get(), NID_secp256k1) <= 0) {
    throw std::runtime_error("secp256k1 keygen setup failed: " + LastOpenSSLError());
  }

  EVP_PKEY *raw = nullptr;
  if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0) {
    throw std::runtime_error("EVP_PKEY_keygen failed: " + LastOpenSSLError());
  }
  return ECKey(PKeyPtr(raw));
}

std::vector<uint8_t> ECKey::Sign(const std::string &message) const {
  MDCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx ||
      EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, pkey_.get()) != 1) {
    LOG_CRYPTO_ERROR("EVP_DigestSignInit failed: {}", LastOpenSSLError());
    return {};
  }

  const auto *msg = reinterpret_cast<const unsigned char *>(message.data());
  size_t sig_len = 0;
  if (EVP_DigestSign(ctx.get(), nullptr, &sig_len, msg, message.size()) != 1) {
    LOG_CRYPTO_ERROR("EVP_DigestSign (size query) failed: {}", LastOpenSSLError());
    return {};
  }

  std::vector<uint8_t> sig(sig_len);
  if (EVP_DigestSign(ctx.get(), sig.data(), &sig_len, msg, message.size()) != 1) {
    LOG_CRYPTO_ERROR("EVP_DigestSign failed: {}", LastOpenSSLError());
    return {};
  }
  // DER ECDSA signatures vary in length
  sig.resize(sig_len);
  return sig;
}

std::string ECKey::PublicKeyHex() const { return public_key_hex_; }

bool ECKey::Verify(const std::string &public_key_hex, const std::string &message,
                   const std::vector<uint8_t> &signature) {
  if (signature.empty()) {
    return false;
  }
  auto der = util::ParseHex(public_key_hex);
  if (!der || der->empty()) {
    return false;
  }

  const unsigned char *p = der->data();
  PKeyPtr pkey(d2i_PUBKEY(nullptr, &p, static_cast<long>(der->size())));
  if (!pkey) {
    LOG_CRYPTO_DEBUG("Rejecting malformed public key");
    ERR_clear_error();
    return false;
  }

  MDCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx ||
      EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, pkey.get()) != 1) {
    LOG_CRYPTO_ERROR("EVP_DigestVerifyInit failed: {}", LastOpenSSLError());
    return false;
  }

  int rc = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                            reinterpret_cast<const unsigned char *>(message.data()),
                            message.size());
  if (rc != 1) {
    // Malformed DER also lands here; leave no stale entries on the error queue
    ERR_clear_error();
    return false;
  }
  return true;
}

} // namespace crypto
} // namespace dagsync
