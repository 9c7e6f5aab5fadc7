#ifndef STRINGS_H
#define STRINGS_H

#include <algorithm>
#include <compare>

#include "hex.h"
#include "utils.h"

/**
 * Fixed-size byte string, base of Hash and Address.
 * @tparam N The size of the string in bytes.
 */
template <unsigned N> class FixedBytes {
  protected:
    BytesArr<N> data_; ///< Internal data.

  public:
    /// Zero-filled constructor.
    constexpr FixedBytes() : data_() {}

    /// Constructor from a fixed array.
    constexpr explicit FixedBytes(const BytesArr<N>& data) : data_(data) {}

    /**
     * Constructor from a byte view.
     * @throw DynamicException if the size doesn't match.
     */
    explicit FixedBytes(const BytesArrView data) {
      if (data.size() != N) throw DynamicException(
        "Invalid size for FixedBytes<", N, ">: ", data.size()
      );
      std::copy(data.begin(), data.end(), this->data_.begin());
    }

    /// Getter for the raw array.
    inline const BytesArr<N>& get() const { return this->data_; }
    inline const Byte* raw() const { return this->data_.data(); }
    inline auto cbegin() const { return this->data_.cbegin(); }
    inline auto cend() const { return this->data_.cend(); }
    inline auto begin() const { return this->data_.cbegin(); }
    inline auto end() const { return this->data_.cend(); }
    static constexpr std::size_t size() { return N; }

    /// Get a view over the whole string.
    inline BytesArrView view() const { return BytesArrView(this->data_.data(), N); }

    /// Copy into a dynamic Bytes vector.
    inline Bytes asBytes() const { return Bytes(this->data_.cbegin(), this->data_.cend()); }

    /**
     * Hex representation of the string.
     * @param strict If true, prefix with "0x".
     */
    inline Hex hex(bool strict = false) const { return Hex::fromBytes(this->view(), strict); }

    /// True if every byte is zero.
    inline bool isZero() const {
      return std::all_of(this->data_.cbegin(), this->data_.cend(), [](Byte b) { return b == 0; });
    }

    /// Byte-wise (big-endian) ordering.
    inline auto operator<=>(const FixedBytes& other) const = default;
    inline bool operator==(const FixedBytes& other) const = default;
};

/// 32-byte hash.
class Hash : public FixedBytes<32> {
  public:
    using FixedBytes<32>::FixedBytes;

    Hash() = default;

    /// Constructor from a 256-bit integer, big-endian.
    explicit Hash(const uint256_t& data) : FixedBytes<32>(Utils::uint256ToBytes(data)) {}

    /// Convert back into a 256-bit integer.
    uint256_t toUint256() const { return Utils::bytesToUint256(this->view()); }

    /**
     * Build a Hash from a hex string.
     * @throw DynamicException if the decoded string is not 32 bytes long.
     */
    static Hash fromHex(std::string_view hex) { return Hash(BytesArrView(Hex::toBytes(hex))); }
};

/// 20-byte account address.
class Address : public FixedBytes<20> {
  public:
    using FixedBytes<20>::FixedBytes;

    /**
     * Build an Address from a hex string.
     * @throw DynamicException if the decoded string is not 20 bytes long.
     */
    static Address fromHex(std::string_view hex) { return Address(BytesArrView(Hex::toBytes(hex))); }
};

#endif // STRINGS_H
