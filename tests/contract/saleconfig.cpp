#include <catch2/catch_test_macros.hpp>

#include "../componenttestsuite.hpp"

namespace TSaleConfig {
  TEST_CASE("SaleConfig Class", "[contract][saleconfig]") {
    SECTION("SaleConfig initial parameters") {
      ComponentTestSuite sdk("testSaleConfigInitial");
      const SaleConfig& config = sdk.harness->config;
      REQUIRE(config.presaleActive() == true);
      REQUIRE(config.publicSaleActive() == false);
      REQUIRE(config.isPhaseActive(SaleClass::Whitelist) == true);
      REQUIRE(config.isPhaseActive(SaleClass::Public) == false);
      REQUIRE(config.unitPrice(SaleClass::Whitelist) == uint256_t("50000000000000000"));
      REQUIRE(config.unitPrice(SaleClass::Public) == uint256_t("80000000000000000"));
      REQUIRE(config.maxSupply() == 100);
      REQUIRE(config.perAddressCap(SaleClass::Whitelist) == 5);
      REQUIRE(config.perAddressCap(SaleClass::Public) == 10);
      REQUIRE(saleClassToString(SaleClass::Whitelist) == "whitelist");
      REQUIRE(saleClassToString(SaleClass::Public) == "public");
    }

    SECTION("SaleConfig phase flags are independent") {
      ComponentTestSuite sdk("testSaleConfigPhases");
      SaleConfig& config = sdk.harness->config;
      sdk.run([&] { config.setPublicSale(true); });
      REQUIRE(config.presaleActive() == true);
      REQUIRE(config.publicSaleActive() == true);
      sdk.run([&] { config.setPresale(false); });
      REQUIRE(config.presaleActive() == false);
      REQUIRE(config.publicSaleActive() == true);
      sdk.run([&] { config.setPhase(false, false); });
      REQUIRE_FALSE(config.isPhaseActive(SaleClass::Whitelist));
      REQUIRE_FALSE(config.isPhaseActive(SaleClass::Public));
    }

    SECTION("SaleConfig switchToPublicPhase moves both flags") {
      ComponentTestSuite sdk("testSaleConfigSwitch");
      SaleConfig& config = sdk.harness->config;
      sdk.run([&] { config.switchToPublicPhase(); });
      REQUIRE(config.presaleActive() == false);
      REQUIRE(config.publicSaleActive() == true);

      // Both flags come back together if the call fails afterwards.
      sdk.run([&] { config.setPhase(true, false); });
      REQUIRE_THROWS(sdk.run([&] {
        config.switchToPublicPhase();
        throw DynamicException("abort");
      }));
      REQUIRE(config.presaleActive() == true);
      REQUIRE(config.publicSaleActive() == false);
    }

    SECTION("SaleConfig setters") {
      ComponentTestSuite sdk("testSaleConfigSetters");
      SaleConfig& config = sdk.harness->config;
      sdk.run([&] {
        config.setUnitPrice(SaleClass::Whitelist, 11);
        config.setUnitPrice(SaleClass::Public, 22);
        config.setMaxSupply(333);
        config.setPerAddressCap(SaleClass::Whitelist, 4);
        config.setPerAddressCap(SaleClass::Public, 0);
      });
      SaleParams params = config.params();
      REQUIRE(params.whitelistUnitPrice == 11);
      REQUIRE(params.publicUnitPrice == 22);
      REQUIRE(params.maxSupply == 333);
      REQUIRE(params.maxWhitelistMintPerAddress == 4);
      REQUIRE(params.maxPublicMintPerAddress == 0);
      REQUIRE(params.presaleActive == true);
      REQUIRE(params.publicSaleActive == false);
    }

    SECTION("SaleConfig survives a save and restore") {
      ComponentTestSuite sdk("testSaleConfigPersistence");
      sdk.run([&] {
        sdk.harness->config.switchToPublicPhase();
        sdk.harness->config.setUnitPrice(SaleClass::Public, 123456789);
        sdk.harness->config.setMaxSupply(42);
      });
      sdk.harness->save();

      SaleParams blank;
      ComponentHarness restored(sdk.host, sdk.harnessAddress, sdk.owner, *sdk.db, blank);
      restored.restore();
      SaleParams params = restored.config.params();
      REQUIRE(params.presaleActive == false);
      REQUIRE(params.publicSaleActive == true);
      REQUIRE(params.whitelistUnitPrice == uint256_t("50000000000000000"));
      REQUIRE(params.publicUnitPrice == 123456789);
      REQUIRE(params.maxSupply == 42);
      REQUIRE(params.maxWhitelistMintPerAddress == 5);
      REQUIRE(params.maxPublicMintPerAddress == 10);
    }
  }
}
