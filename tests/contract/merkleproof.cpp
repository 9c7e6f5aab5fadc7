#include <catch2/catch_test_macros.hpp>

#include "../../src/contract/merkleproof.h"
#include "../saletestsuite.hpp"

namespace TMerkleProof {
  Hash flipBit(const Hash& hash, std::size_t byte) {
    BytesArr<32> data = hash.get();
    data[byte] ^= 0x01;
    return Hash(data);
  }

  TEST_CASE("MerkleProof Namespace", "[contract][merkleproof]") {
    SECTION("leafFor hashes the raw address bytes") {
      Address account = makeAddress("leaf");
      REQUIRE(MerkleProof::leafFor(account) == Utils::sha3(account.view()));
    }

    SECTION("hashPair is commutative") {
      Hash a = Utils::sha3(Utils::create_view_span(std::string("a")));
      Hash b = Utils::sha3(Utils::create_view_span(std::string("b")));
      REQUIRE(MerkleProof::hashPair(a, b) == MerkleProof::hashPair(b, a));
      REQUIRE(MerkleProof::hashPair(a, b) != MerkleProof::hashPair(a, a));
    }

    SECTION("processProof with an empty proof returns the leaf") {
      Hash leaf = MerkleProof::leafFor(makeAddress("alone"));
      REQUIRE(MerkleProof::processProof({}, leaf) == leaf);
    }
  }

  TEST_CASE("MerkleTree Class", "[contract][merkleproof]") {
    SECTION("Every member's proof verifies") {
      for (std::size_t count : {2, 3, 5, 8, 13}) {
        std::vector<Address> members = SaleTestSuite::makeAccounts(count);
        MerkleTree tree(members);
        REQUIRE(tree.size() == count);
        for (const Address& member : members) {
          auto proof = tree.getProof(member);
          REQUIRE(proof.has_value());
          REQUIRE(tree.contains(member));
          REQUIRE(MerkleProof::verify(*proof, tree.root(), member));
        }
      }
    }

    SECTION("Non-members have no proof and can't borrow one") {
      std::vector<Address> members = SaleTestSuite::makeAccounts(4);
      MerkleTree tree(members);
      Address outsider = makeAddress("outsider");
      REQUIRE_FALSE(tree.contains(outsider));
      REQUIRE_FALSE(tree.getProof(outsider).has_value());
      for (const Address& member : members) {
        REQUIRE_FALSE(MerkleProof::verify(tree.getProof(member).value(), tree.root(), outsider));
      }
      REQUIRE_FALSE(MerkleProof::verify({}, tree.root(), outsider));
    }

    SECTION("Tampered proofs and roots fail") {
      std::vector<Address> members = SaleTestSuite::makeAccounts(6);
      MerkleTree tree(members);
      const Address& member = members[2];
      std::vector<Hash> proof = tree.getProof(member).value();
      REQUIRE(proof.size() >= 2);

      std::vector<Hash> tampered = proof;
      tampered[0] = flipBit(tampered[0], 31);
      REQUIRE_FALSE(MerkleProof::verify(tampered, tree.root(), member));
      tampered = proof;
      tampered.back() = flipBit(tampered.back(), 0);
      REQUIRE_FALSE(MerkleProof::verify(tampered, tree.root(), member));

      REQUIRE_FALSE(MerkleProof::verify(proof, flipBit(tree.root(), 7), member));
      std::vector<Hash> truncated(proof.begin(), proof.end() - 1);
      REQUIRE_FALSE(MerkleProof::verify(truncated, tree.root(), member));
    }

    SECTION("Single leaf tree") {
      Address only = makeAddress("only");
      MerkleTree tree(std::vector<Address>{only});
      REQUIRE(tree.root() == MerkleProof::leafFor(only));
      REQUIRE(tree.getProof(only).value().empty());
      REQUIRE(MerkleProof::verify({}, tree.root(), only));
    }

    SECTION("Odd node is promoted unchanged") {
      std::vector<Address> members = SaleTestSuite::makeAccounts(3);
      MerkleTree tree(members);
      std::vector<Hash> proof = tree.getProof(members[2]).value();
      REQUIRE(proof.size() == 1);
      Hash pair = MerkleProof::hashPair(MerkleProof::leafFor(members[0]), MerkleProof::leafFor(members[1]));
      REQUIRE(proof[0] == pair);
      REQUIRE(tree.root() == MerkleProof::hashPair(pair, MerkleProof::leafFor(members[2])));
    }

    SECTION("Duplicates are collapsed") {
      std::vector<Address> members = SaleTestSuite::makeAccounts(3);
      std::vector<Address> withDuplicates = members;
      withDuplicates.push_back(members[0]);
      withDuplicates.push_back(members[2]);
      MerkleTree tree(withDuplicates);
      REQUIRE(tree.size() == 3);
      REQUIRE(tree.root() == MerkleTree(members).root());
    }

    SECTION("Empty list throws") {
      REQUIRE_THROWS(MerkleTree(std::vector<Address>{}));
    }
  }
}
