#include <catch2/catch_test_macros.hpp>

#include <limits>
#include <stdexcept>

#include "../componenttestsuite.hpp"

namespace TClaimLedger {
  TEST_CASE("ClaimLedger Class", "[contract][claimledger]") {
    SECTION("ClaimLedger starts empty") {
      ComponentTestSuite sdk("testClaimLedgerEmpty");
      const ClaimLedger& claims = sdk.harness->claims;
      REQUIRE(claims.size() == 0);
      REQUIRE_FALSE(claims.hasEntry(makeAddress("nobody")));
      REQUIRE(claims.claimed(makeAddress("nobody"), SaleClass::Whitelist) == 0);
      REQUIRE(claims.claimed(makeAddress("nobody"), SaleClass::Public) == 0);
    }

    SECTION("ClaimLedger counters are per address and per class") {
      ComponentTestSuite sdk("testClaimLedgerRecord");
      ClaimLedger& claims = sdk.harness->claims;
      const Address alice = makeAddress("alice");
      const Address bob = makeAddress("bob");
      sdk.run([&] {
        claims.record(alice, SaleClass::Whitelist, 2);
        claims.record(alice, SaleClass::Whitelist, 1);
        claims.record(alice, SaleClass::Public, 4);
        claims.record(bob, SaleClass::Public, 7);
      });
      REQUIRE(claims.size() == 2);
      REQUIRE(claims.claimed(alice, SaleClass::Whitelist) == 3);
      REQUIRE(claims.claimed(alice, SaleClass::Public) == 4);
      REQUIRE(claims.claimed(bob, SaleClass::Whitelist) == 0);
      REQUIRE(claims.claimed(bob, SaleClass::Public) == 7);
      ClaimEntry entry = claims.entry(alice);
      REQUIRE(entry.whitelistClaimed == 3);
      REQUIRE(entry.publicClaimed == 4);
    }

    SECTION("ClaimLedger records are dropped when the call fails") {
      ComponentTestSuite sdk("testClaimLedgerRevert");
      ClaimLedger& claims = sdk.harness->claims;
      const Address alice = makeAddress("alice");
      sdk.run([&] { claims.record(alice, SaleClass::Public, 1); });
      REQUIRE_THROWS(sdk.run([&] {
        claims.record(alice, SaleClass::Public, 5);
        claims.record(makeAddress("bob"), SaleClass::Whitelist, 1);
        throw DynamicException("abort");
      }));
      REQUIRE(claims.claimed(alice, SaleClass::Public) == 1);
      REQUIRE_FALSE(claims.hasEntry(makeAddress("bob")));
      REQUIRE(claims.size() == 1);
    }

    SECTION("ClaimLedger counter overflow aborts the call") {
      ComponentTestSuite sdk("testClaimLedgerOverflow");
      ClaimLedger& claims = sdk.harness->claims;
      const Address alice = makeAddress("alice");
      const uint256_t max = std::numeric_limits<uint256_t>::max();
      sdk.run([&] { claims.record(alice, SaleClass::Whitelist, max); });
      REQUIRE_THROWS_AS(sdk.run([&] { claims.record(alice, SaleClass::Whitelist, 1); }), std::overflow_error);
      REQUIRE(claims.claimed(alice, SaleClass::Whitelist) == max);
    }

    SECTION("ClaimLedger survives a save and restore") {
      ComponentTestSuite sdk("testClaimLedgerPersistence");
      const Address alice = makeAddress("alice");
      const Address bob = makeAddress("bob");
      sdk.run([&] {
        sdk.harness->claims.record(alice, SaleClass::Whitelist, 2);
        sdk.harness->claims.record(bob, SaleClass::Public, 9);
      });
      sdk.harness->save();

      ComponentHarness restored(sdk.host, sdk.harnessAddress, sdk.owner, *sdk.db);
      restored.restore();
      REQUIRE(restored.claims.size() == 2);
      REQUIRE(restored.claims.claimed(alice, SaleClass::Whitelist) == 2);
      REQUIRE(restored.claims.claimed(alice, SaleClass::Public) == 0);
      REQUIRE(restored.claims.claimed(bob, SaleClass::Public) == 9);
    }

    SECTION("ClaimLedger refuses corrupted entries") {
      ComponentTestSuite sdk("testClaimLedgerCorrupted");
      const Bytes prefix = sdk.harness->getNewPrefix("claims_");
      REQUIRE(sdk.db->put(makeAddress("alice").view(), Bytes(10, 0x01), prefix));
      ComponentHarness restored(sdk.host, sdk.harnessAddress, sdk.owner, *sdk.db);
      REQUIRE_THROWS_AS(restored.claims.load(*sdk.db, restored), DynamicException);
    }
  }
}
