#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Hex encoding/decoding for signatures, public keys and opaque payloads
 - Returns std::nullopt on any parsing error (no exceptions thrown)
 - Safe for use with untrusted input (wire messages from peers)
*/

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dagsync {
namespace util {

/**
 * Validate hexadecimal string
 *
 * @return true if all characters are hex digits [0-9a-fA-F]
 *
 * Examples:
 *   IsValidHex("deadbeef") -> true
 *   IsValidHex("xyz") -> false
 *   IsValidHex("") -> false
 */
bool IsValidHex(const std::string& str);

// Lower-case hex encoding of a byte sequence
std::string HexStr(const uint8_t* data, size_t size);
std::string HexStr(const std::vector<uint8_t>& bytes);

/**
 * Decode a hex string into bytes
 *
 * Empty input decodes to an empty vector. Odd length or non-hex characters
 * return std::nullopt.
 */
std::optional<std::vector<uint8_t>> ParseHex(const std::string& str);

} // namespace util
} // namespace dagsync
