#include "utils.h"
#include "strings.h"

#include <ethash/keccak.hpp>

std::mutex Utils::cout_mutex;

bool Utils::logToCout = false;

void Utils::safePrint(std::string_view str) {
  if (!Utils::logToCout) return;
  std::lock_guard lock(cout_mutex);
  std::cout << str << std::endl;
}

Hash Utils::sha3(const BytesArrView input) {
  ethash::hash256 h = ethash::keccak256(input.data(), input.size());
  BytesArr<32> ret;
  std::copy(std::begin(h.bytes), std::end(h.bytes), ret.begin());
  return Hash(ret);
}

BytesArr<32> Utils::uint256ToBytes(const uint256_t& i) {
  BytesArr<32> ret = {};
  Bytes tmp;
  tmp.reserve(32);
  boost::multiprecision::export_bits(i, std::back_inserter(tmp), 8);
  // export_bits drops leading zeroes, pad from the left.
  std::copy(tmp.cbegin(), tmp.cend(), ret.begin() + (32 - tmp.size()));
  return ret;
}

BytesArr<8> Utils::uint64ToBytes(const uint64_t& i) {
  BytesArr<8> ret;
  for (int j = 0; j < 8; j++) ret[j] = Byte(i >> (8 * (7 - j)));
  return ret;
}

uint256_t Utils::bytesToUint256(const BytesArrView b) {
  if (b.size() != 32) throw DynamicException(
    "Invalid bytes size - expected 32, got ", b.size()
  );
  uint256_t ret;
  boost::multiprecision::import_bits(ret, b.begin(), b.end(), 8);
  return ret;
}

uint64_t Utils::bytesToUint64(const BytesArrView b) {
  if (b.size() != 8) throw DynamicException(
    "Invalid bytes size - expected 8, got ", b.size()
  );
  uint64_t ret = 0;
  for (const Byte& byte : b) ret = (ret << 8) | byte;
  return ret;
}

Bytes Utils::stringToBytes(const std::string& str) {
  return Bytes(str.cbegin(), str.cend());
}

std::string Utils::bytesToString(const BytesArrView b) {
  return std::string(b.begin(), b.end());
}
