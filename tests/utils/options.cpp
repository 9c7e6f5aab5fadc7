#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

#include "../../src/utils/options.h"

namespace TOptions {
  TEST_CASE("Options Class", "[utils][options]") {
    SECTION("Options from File (default)") {
      if (std::filesystem::exists("optionsClassDefault")) std::filesystem::remove_all("optionsClassDefault");
      Options defaults = Options::fromFile("optionsClassDefault");
      REQUIRE(std::filesystem::exists("optionsClassDefault/options.json"));
      REQUIRE(defaults.getRootPath() == "optionsClassDefault");
      REQUIRE(defaults.getName() == "MintGate Genesis");
      REQUIRE(defaults.getSymbol() == "MGG");
      REQUIRE(defaults.getContractAddress() == Address::fromHex("0x5b5f4a1ad5ec3d5ea1a7df0fee8dec2cc2f1b8d1"));
      REQUIRE(defaults.getOwner() == Address::fromHex("0x00dead00665771855a34155f5e7405489df2c3c6"));
      REQUIRE(defaults.getTreasury() == defaults.getOwner());
      REQUIRE(defaults.getAllowlistRoot() == Hash());
      REQUIRE(defaults.getWhitelistUnitPrice() == uint256_t("50000000000000000"));
      REQUIRE(defaults.getPublicUnitPrice() == uint256_t("80000000000000000"));
      REQUIRE(defaults.getMaxSupply() == 10000);
      REQUIRE(defaults.getMaxWhitelistMintPerAddress() == 2);
      REQUIRE(defaults.getMaxPublicMintPerAddress() == 5);
      REQUIRE(defaults.getPresaleActive() == false);
      REQUIRE(defaults.getPublicSaleActive() == false);
      REQUIRE(defaults.getAdmins().empty());

      // Second load reads the file that was just written.
      Options reloaded = Options::fromFile("optionsClassDefault");
      REQUIRE(reloaded.toJson() == defaults.toJson());
    }

    SECTION("Options from File (custom)") {
      std::vector<Address> admins {
        Address::fromHex("0x7588b0f553d1910266089c58822e1120db47e572"),
        Address::fromHex("0x5fb516dc2cfc1288e689ed377a9eebe2216cf1e3")
      };
      Options custom(
        "optionsClassCustom", "Custom Collection", "CC", "ipfs://custom/",
        Address::fromHex("0x795083c42583842774febc21abb6df09e784fce5"),
        Address::fromHex("0xbec7b74f70c151707a0bfb20fe3767c6e65499e0"),
        Address::fromHex("0xcabf34a268847a610287709d841e5cd590cc5c00"),
        Hash::fromHex("0xaaa1c7a9f1c2cfa4a6b5cd3a9d4e5f60718293a4b5c6d7e8f901122334455667"),
        uint256_t(1), uint256_t(2), uint256_t(300), uint256_t(4), uint256_t(5),
        true, false, admins
      );

      Options fromFile = Options::fromFile("optionsClassCustom");
      REQUIRE(fromFile.getRootPath() == custom.getRootPath());
      REQUIRE(fromFile.getName() == custom.getName());
      REQUIRE(fromFile.getSymbol() == custom.getSymbol());
      REQUIRE(fromFile.getBaseURI() == custom.getBaseURI());
      REQUIRE(fromFile.getContractAddress() == custom.getContractAddress());
      REQUIRE(fromFile.getOwner() == custom.getOwner());
      REQUIRE(fromFile.getTreasury() == custom.getTreasury());
      REQUIRE(fromFile.getAllowlistRoot() == custom.getAllowlistRoot());
      REQUIRE(fromFile.getWhitelistUnitPrice() == custom.getWhitelistUnitPrice());
      REQUIRE(fromFile.getPublicUnitPrice() == custom.getPublicUnitPrice());
      REQUIRE(fromFile.getMaxSupply() == custom.getMaxSupply());
      REQUIRE(fromFile.getMaxWhitelistMintPerAddress() == custom.getMaxWhitelistMintPerAddress());
      REQUIRE(fromFile.getMaxPublicMintPerAddress() == custom.getMaxPublicMintPerAddress());
      REQUIRE(fromFile.getPresaleActive() == custom.getPresaleActive());
      REQUIRE(fromFile.getPublicSaleActive() == custom.getPublicSaleActive());
      REQUIRE(fromFile.getAdmins() == custom.getAdmins());
    }

    SECTION("Options from File (malformed)") {
      std::filesystem::create_directories("optionsClassMalformed");
      std::ofstream o("optionsClassMalformed/options.json");
      o << "{\"rootPath\": \"optionsClassMalformed\", \"name\": 42" << std::endl;
      o.close();
      REQUIRE_THROWS_AS(Options::fromFile("optionsClassMalformed"), DynamicException);
    }
  }
}
