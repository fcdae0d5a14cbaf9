#include "util/string_parsing.hpp"
#include <cctype>

namespace dagsync {
namespace util {

namespace {
constexpr char kHexDigits[] = "0123456789abcdef";

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}
} // namespace

bool IsValidHex(const std::string& str) {
  if (str.empty()) {
    return false;
  }

  for (char c : str) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

std::string HexStr(const uint8_t* data, size_t size) {
  std::string out;
  out.reserve(size * 2);
  for (size_t i = 0; i < size; ++i) {
    out.push_back(kHexDigits[data[i] >> 4]);
    out.push_back(kHexDigits[data[i] & 0x0f]);
  }
  return out;
}

std::string HexStr(const std::vector<uint8_t>& bytes) {
  return HexStr(bytes.data(), bytes.size());
}

std::optional<std::vector<uint8_t>> ParseHex(const std::string& str) {
  if (str.empty()) {
    return std::vector<uint8_t>{};
  }
  if (str.size() % 2 != 0 || !IsValidHex(str)) {
    return std::nullopt;
  }

  std::vector<uint8_t> out;
  out.reserve(str.size() / 2);
  for (size_t i = 0; i < str.size(); i += 2) {
    out.push_back(static_cast<uint8_t>((HexValue(str[i]) << 4) | HexValue(str[i + 1])));
  }
  return out;
}

} // namespace util
} // namespace dagsync
