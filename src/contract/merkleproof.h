#ifndef MERKLEPROOF_H
#define MERKLEPROOF_H

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

#include "../utils/safehash.h"
#include "../utils/strings.h"
#include "../utils/utils.h"

/**
 * Allowlist membership proofs.
 * Leaves are keccak256 of the 20 raw address bytes. Inner nodes hash the
 * sorted pair of children (smaller first), so a proof is just the list of
 * siblings from leaf to root, with no left/right flags.
 */
namespace MerkleProof {
  /// keccak256 of the raw address bytes.
  Hash leafFor(const Address& claimant);

  /// keccak256 of the two hashes concatenated smaller-first.
  Hash hashPair(const Hash& a, const Hash& b);

  /**
   * Rebuild the root implied by a leaf and its authentication path.
   * @param proof Sibling hashes, leaf level first.
   * @param leaf The starting leaf.
   */
  Hash processProof(const std::vector<Hash>& proof, const Hash& leaf);

  /**
   * Check that `claimant` belongs to the set committed by `root`.
   * @param proof Sibling hashes, leaf level first.
   * @param root The published commitment.
   * @param claimant The address being checked.
   * @return `true` only on an exact root match.
   */
  bool verify(const std::vector<Hash>& proof, const Hash& root, const Address& claimant);
}

/**
 * Merkle tree over a list of addresses, built with the same rules
 * MerkleProof::verify checks. A node without a sibling at some level is
 * promoted unchanged to the level above.
 */
class MerkleTree {
  private:
    std::vector<std::vector<Hash>> layers_; ///< layers_[0] are the leaves, layers_.back() is the root.
    std::unordered_map<Address, std::size_t, SafeHash> leafIndex_; ///< Leaf position of each address.

  public:
    /**
     * Constructor.
     * @param addresses The allowlisted addresses, in leaf order. Duplicates keep their first position.
     * @throw DynamicException if the list is empty.
     */
    explicit MerkleTree(const std::vector<Address>& addresses);

    /// The root (commitment) of the tree.
    const Hash& root() const { return this->layers_.back().front(); }

    /// Number of leaves.
    std::size_t size() const { return this->layers_.front().size(); }

    /// Whether an address is in the tree.
    bool contains(const Address& address) const { return this->leafIndex_.contains(address); }

    /**
     * Authentication path for an address.
     * @return The sibling list, or std::nullopt if the address isn't a leaf.
     */
    std::optional<std::vector<Hash>> getProof(const Address& address) const;
};

#endif // MERKLEPROOF_H
