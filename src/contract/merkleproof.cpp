#include "merkleproof.h"

Hash MerkleProof::leafFor(const Address& claimant) {
  return Utils::sha3(claimant.view());
}

Hash MerkleProof::hashPair(const Hash& a, const Hash& b) {
  Bytes packed;
  packed.reserve(64);
  if (a < b) {
    Utils::appendBytes(packed, a.get());
    Utils::appendBytes(packed, b.get());
  } else {
    Utils::appendBytes(packed, b.get());
    Utils::appendBytes(packed, a.get());
  }
  return Utils::sha3(packed);
}

Hash MerkleProof::processProof(const std::vector<Hash>& proof, const Hash& leaf) {
  Hash computed = leaf;
  for (const Hash& sibling : proof) computed = hashPair(computed, sibling);
  return computed;
}

bool MerkleProof::verify(const std::vector<Hash>& proof, const Hash& root, const Address& claimant) {
  return processProof(proof, leafFor(claimant)) == root;
}

MerkleTree::MerkleTree(const std::vector<Address>& addresses) {
  if (addresses.empty()) throw DynamicException("MerkleTree: can't build a tree without leaves");
  std::vector<Hash> leaves;
  leaves.reserve(addresses.size());
  for (const Address& address : addresses) {
    if (this->leafIndex_.try_emplace(address, leaves.size()).second) {
      leaves.push_back(MerkleProof::leafFor(address));
    }
  }
  this->layers_.push_back(std::move(leaves));
  while (this->layers_.back().size() > 1) {
    const std::vector<Hash>& current = this->layers_.back();
    std::vector<Hash> next;
    next.reserve((current.size() + 1) / 2);
    for (std::size_t i = 0; i < current.size(); i += 2) {
      if (i + 1 < current.size()) {
        next.push_back(MerkleProof::hashPair(current[i], current[i + 1]));
      } else {
        next.push_back(current[i]);
      }
    }
    this->layers_.push_back(std::move(next));
  }
}

std::optional<std::vector<Hash>> MerkleTree::getProof(const Address& address) const {
  auto it = this->leafIndex_.find(address);
  if (it == this->leafIndex_.end()) return std::nullopt;
  std::vector<Hash> proof;
  std::size_t index = it->second;
  for (std::size_t level = 0; level + 1 < this->layers_.size(); level++) {
    const std::vector<Hash>& layer = this->layers_[level];
    std::size_t sibling = (index % 2 == 0) ? index + 1 : index - 1;
    // A promoted node has no sibling at this level.
    if (sibling < layer.size()) proof.push_back(layer[sibling]);
    index /= 2;
  }
  return proof;
}
