#ifndef UTILS_H
#define UTILS_H

#include <array>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

#include "dynamicexception.h"

using Byte = uint8_t; ///< Typedef for Byte.
using Bytes = std::vector<Byte>; ///< Typedef for Bytes.
template <std::size_t N> using BytesArr = std::array<Byte, N>; ///< Typedef for BytesArr.
using BytesArrView = std::span<const Byte, std::dynamic_extent>; ///< Typedef for BytesArrView.

/**
 * 256-bit unsigned integer. Checked: arithmetic that leaves the range throws
 * std::overflow_error (or std::range_error on underflow) instead of wrapping.
 */
using uint256_t = boost::multiprecision::number<boost::multiprecision::cpp_int_backend<
  256, 256, boost::multiprecision::unsigned_magnitude, boost::multiprecision::checked, void
>>;

class Hash; // Forward declaration, see strings.h

/// Namespace for utility functions.
namespace Utils {
  extern std::mutex cout_mutex; ///< Mutex for printing to the console.
  extern bool logToCout; ///< Whether safePrint() should actually print.

  /**
   * Print a string to stdout, thread-safe, only if logToCout is enabled.
   * @param str The string to print.
   */
  void safePrint(std::string_view str);

  /**
   * Keccak-256 hash of a byte sequence.
   * @param input The bytes to hash.
   * @return The resulting 32-byte hash.
   */
  Hash sha3(const BytesArrView input);

  /**
   * Convert a 256-bit unsigned integer to 32 big-endian bytes.
   * @param i The integer to convert.
   * @return The converted bytes.
   */
  BytesArr<32> uint256ToBytes(const uint256_t& i);

  /**
   * Convert a 64-bit unsigned integer to 8 big-endian bytes.
   * @param i The integer to convert.
   * @return The converted bytes.
   */
  BytesArr<8> uint64ToBytes(const uint64_t& i);

  /**
   * Convert exactly 32 big-endian bytes to a 256-bit unsigned integer.
   * @param b The bytes to convert.
   * @return The converted integer.
   * @throw DynamicException if the size is not 32.
   */
  uint256_t bytesToUint256(const BytesArrView b);

  /**
   * Convert exactly 8 big-endian bytes to a 64-bit unsigned integer.
   * @throw DynamicException if the size is not 8.
   */
  uint64_t bytesToUint64(const BytesArrView b);

  /// Convert a string to its raw bytes.
  Bytes stringToBytes(const std::string& str);

  /// Convert raw bytes to a string.
  std::string bytesToString(const BytesArrView b);

  /**
   * Append any byte container to a Bytes vector.
   * @param vec The vector to append to.
   * @param bytes The container to append.
   */
  template<typename T> inline void appendBytes(Bytes& vec, const T& bytes) {
    vec.insert(vec.end(), bytes.cbegin(), bytes.cend());
  }

  /**
   * Create a BytesArrView from any contiguous byte container.
   */
  template<typename T> inline BytesArrView create_view_span(const T& container) {
    return BytesArrView(container.data(), container.size());
  }

  /// Create a BytesArrView over the raw characters of a string.
  inline BytesArrView create_view_span(const std::string& str) {
    return BytesArrView(reinterpret_cast<const Byte*>(str.data()), str.size());
  }
};

#endif // UTILS_H
