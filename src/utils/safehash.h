#ifndef SAFEHASH_H
#define SAFEHASH_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <string_view>

#include "strings.h"
#include "utils.h"

/**
 * Hasher for unordered containers keyed by user-controlled data.
 * Mixes a per-process seed through splitmix64 so keys can't be crafted to collide.
 */
struct SafeHash {
  static uint64_t splitmix(uint64_t i) {
    i += 0x9e3779b97f4a7c15;
    i = (i ^ (i >> 30)) * 0xbf58476d1ce4e5b9;
    i = (i ^ (i >> 27)) * 0x94d049bb133111eb;
    return i ^ (i >> 31);
  }

  static uint64_t seed() {
    static const uint64_t FIXED_RANDOM = std::chrono::steady_clock::now().time_since_epoch().count();
    return FIXED_RANDOM;
  }

  static size_t hashBytes(const BytesArrView b) {
    std::string_view sv(reinterpret_cast<const char*>(b.data()), b.size());
    return splitmix(std::hash<std::string_view>()(sv) + seed());
  }

  size_t operator()(const uint64_t& i) const { return splitmix(i + seed()); }

  size_t operator()(const uint256_t& i) const { return hashBytes(Utils::uint256ToBytes(i)); }

  size_t operator()(const Address& add) const { return hashBytes(add.view()); }

  size_t operator()(const Hash& h) const { return hashBytes(h.view()); }

  size_t operator()(const std::string& str) const { return splitmix(std::hash<std::string>()(str) + seed()); }
};

#endif // SAFEHASH_H
