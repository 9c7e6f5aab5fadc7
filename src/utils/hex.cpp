#include "hex.h"

#include <cctype>

namespace {
  int hexCharToInt(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  }
}

Hex::Hex(std::string_view value, bool strict) : strict_(strict) {
  std::string_view body = value;
  if (body.starts_with("0x") || body.starts_with("0X")) body.remove_prefix(2);
  if (!Hex::isValid(body)) throw DynamicException("Invalid Hex string: ", value);
  this->hex_ = (strict) ? "0x" + std::string(body) : std::string(body);
}

bool Hex::isValid(std::string_view hex, bool strict) {
  if (hex.starts_with("0x") || hex.starts_with("0X")) {
    hex.remove_prefix(2);
  } else if (strict) {
    return false;
  }
  for (const char& c : hex) if (hexCharToInt(c) == -1) return false;
  return true;
}

Hex Hex::fromBytes(const BytesArrView bytes, bool strict) {
  static const char* digits = "0123456789abcdef";
  std::string ret;
  ret.reserve(bytes.size() * 2);
  for (const Byte& b : bytes) {
    ret += digits[b >> 4];
    ret += digits[b & 0x0f];
  }
  return Hex(ret, strict);
}

Bytes Hex::toBytes(std::string_view hex) {
  if (hex.starts_with("0x") || hex.starts_with("0X")) hex.remove_prefix(2);
  if (!Hex::isValid(hex)) throw DynamicException("Invalid Hex string: ", hex);
  Bytes ret;
  ret.reserve((hex.size() + 1) / 2);
  std::size_t i = 0;
  // Odd length means an implicit leading zero nibble.
  if (hex.size() % 2 != 0) {
    ret.push_back(Byte(hexCharToInt(hex[0])));
    i = 1;
  }
  for (; i < hex.size(); i += 2) {
    ret.push_back(Byte((hexCharToInt(hex[i]) << 4) | hexCharToInt(hex[i + 1])));
  }
  return ret;
}

uint256_t Hex::getUint() const {
  Bytes b = Hex::toBytes(this->hex_);
  if (b.size() > 32) throw DynamicException("Hex too big for uint256_t: ", this->hex_);
  uint256_t ret;
  boost::multiprecision::import_bits(ret, b.begin(), b.end(), 8);
  return ret;
}
