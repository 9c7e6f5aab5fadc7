#include <catch2/catch_test_macros.hpp>

#include <algorithm>

#include "../componenttestsuite.hpp"

namespace TAccessControl {
  TEST_CASE("AdminRegistry Class", "[contract][accesscontrol]") {
    SECTION("AdminRegistry owner is privileged") {
      ComponentTestSuite sdk("testAdminRegistryOwner");
      const AccessControl& access = sdk.harness->access;
      REQUIRE(access.isPrivileged(sdk.owner));
      REQUIRE_FALSE(access.isPrivileged(makeAddress("stranger")));
      REQUIRE(sdk.harness->access.isOwner(sdk.owner));
      REQUIRE(sdk.harness->access.owner() == sdk.owner);
      REQUIRE(sdk.harness->access.admins().empty());
    }

    SECTION("AdminRegistry add and remove admins") {
      ComponentTestSuite sdk("testAdminRegistryAdmins");
      AdminRegistry& access = sdk.harness->access;
      const Address alice = makeAddress("alice");
      const Address bob = makeAddress("bob");
      sdk.run([&] {
        access.addAdmin(alice);
        access.addAdmin(bob);
        access.addAdmin(alice);
      });
      REQUIRE(access.isAdmin(alice));
      REQUIRE(access.isPrivileged(bob));
      REQUIRE_FALSE(access.isOwner(alice));
      std::vector<Address> expected{alice, bob};
      std::sort(expected.begin(), expected.end());
      REQUIRE(access.admins() == expected);

      sdk.run([&] {
        access.removeAdmin(alice);
        access.removeAdmin(makeAddress("neverAdded"));
      });
      REQUIRE_FALSE(access.isAdmin(alice));
      REQUIRE_FALSE(access.isPrivileged(alice));
      REQUIRE(access.admins() == std::vector<Address>{bob});
    }

    SECTION("AdminRegistry changes are dropped when the call fails") {
      ComponentTestSuite sdk("testAdminRegistryRevert");
      AdminRegistry& access = sdk.harness->access;
      const Address alice = makeAddress("alice");
      REQUIRE_THROWS(sdk.run([&] {
        access.addAdmin(alice);
        access.setOwner(alice);
        throw DynamicException("abort");
      }));
      REQUIRE_FALSE(access.isAdmin(alice));
      REQUIRE(access.owner() == sdk.owner);
    }

    SECTION("AdminRegistry setOwner") {
      ComponentTestSuite sdk("testAdminRegistrySetOwner");
      AdminRegistry& access = sdk.harness->access;
      const Address alice = makeAddress("alice");
      sdk.run([&] { access.setOwner(alice); });
      REQUIRE(access.isOwner(alice));
      REQUIRE_FALSE(access.isPrivileged(sdk.owner));
    }

    SECTION("AdminRegistry removed admins don't come back after a restore") {
      ComponentTestSuite sdk("testAdminRegistryPersistence");
      const Address alice = makeAddress("alice");
      const Address bob = makeAddress("bob");
      const Address newOwner = makeAddress("newOwner");
      sdk.run([&] {
        sdk.harness->access.addAdmin(alice);
        sdk.harness->access.addAdmin(bob);
      });
      sdk.harness->save();
      sdk.run([&] {
        sdk.harness->access.removeAdmin(alice);
        sdk.harness->access.setOwner(newOwner);
      });
      sdk.harness->save();

      ComponentHarness restored(sdk.host, sdk.harnessAddress, Address(), *sdk.db);
      restored.restore();
      REQUIRE(restored.access.owner() == newOwner);
      REQUIRE_FALSE(restored.access.isAdmin(alice));
      REQUIRE(restored.access.isAdmin(bob));
      REQUIRE(restored.access.admins() == std::vector<Address>{bob});
    }
  }
}
