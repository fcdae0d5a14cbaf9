// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace dagsync {
namespace crypto {

using Sha256Digest = std::array<uint8_t, 32>;

// SHA-256 via OpenSSL EVP
Sha256Digest Sha256(const uint8_t *data, size_t size);
Sha256Digest Sha256(const std::string &data);

// Lower-case hex of SHA-256(data); used for node ids and message ids
std::string Sha256Hex(const std::string &data);

} // namespace crypto
} // namespace dagsync
