#ifndef HEX_H
#define HEX_H

#include <ostream>
#include <string>
#include <string_view>

#include "utils.h"

/**
 * Abstraction of a hex string.
 * "Strict" hex strings carry the "0x" prefix, non-strict ones don't.
 */
class Hex {
  private:
    std::string hex_; ///< Internal string data.
    bool strict_; ///< Whether the string carries the "0x" prefix.

  public:
    /// Default constructor (empty non-strict string).
    Hex() : strict_(false) {}

    /**
     * Constructor from a string.
     * @param value The hex string, with or without "0x".
     * @param strict Whether the stored string should carry "0x".
     * @throw DynamicException if the string is not valid hex.
     */
    Hex(std::string_view value, bool strict = false);

    /**
     * Check if a string is valid hex.
     * @param hex The string to check.
     * @param strict If true, require the "0x" prefix.
     */
    static bool isValid(std::string_view hex, bool strict = false);

    /**
     * Build a Hex from raw bytes.
     * @param bytes The bytes to encode.
     * @param strict Whether the result should carry "0x".
     */
    static Hex fromBytes(const BytesArrView bytes, bool strict = false);

    /**
     * Decode a hex string into raw bytes. "0x" is optional, case-insensitive.
     * @throw DynamicException on invalid input.
     */
    static Bytes toBytes(std::string_view hex);

    /// Getter for the inner string.
    inline const std::string& get() const { return this->hex_; }

    /// Decode the hex string as a big-endian unsigned integer.
    uint256_t getUint() const;

    inline std::size_t size() const { return this->hex_.size(); }

    inline bool operator==(const Hex& other) const { return this->hex_ == other.hex_; }

    friend std::ostream& operator<<(std::ostream& out, const Hex& other) { return out << other.hex_; }
};

#endif // HEX_H
