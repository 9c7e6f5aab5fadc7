#include <catch2/catch_test_macros.hpp>

#include "../../src/contract/errors.h"
#include "../saletestsuite.hpp"

namespace TERC721 {
  SaleParams openPublicSale() {
    SaleParams params = SaleTestSuite::defaultParams();
    params.presaleActive = false;
    params.publicSaleActive = true;
    params.publicUnitPrice = 0;
    return params;
  }

  TEST_CASE("ERC721 Class", "[contract][erc721]") {
    SECTION("ERC721 ownership after sequential mints") {
      SaleTestSuite sdk("testERC721Ownership", openPublicSale());
      const Address& alice = sdk.accounts[0];
      const Address& bob = sdk.accounts[1];
      sdk.callFunction(alice, 0, [&] { sdk.sale->publicMint(3); });
      sdk.callFunction(bob, 0, [&] { sdk.sale->publicMint(2); });
      sdk.callFunction(alice, 0, [&] { sdk.sale->publicMint(1); });

      REQUIRE(sdk.sale->totalSupply() == 6);
      REQUIRE(sdk.sale->totalMinted() == 6);
      REQUIRE(sdk.sale->balanceOf(alice) == 4);
      REQUIRE(sdk.sale->balanceOf(bob) == 2);
      REQUIRE(sdk.sale->balanceOf(sdk.accounts[2]) == 0);
      REQUIRE(sdk.sale->ownerOf(0) == alice);
      REQUIRE(sdk.sale->ownerOf(3) == bob);
      REQUIRE(sdk.sale->ownerOf(5) == alice);
      REQUIRE(sdk.sale->tokensOfOwner(alice) == std::vector<uint256_t>{0, 1, 2, 5});
      REQUIRE(sdk.sale->tokensOfOwner(bob) == std::vector<uint256_t>{3, 4});
      REQUIRE(sdk.sale->tokensOfOwner(sdk.accounts[2]).empty());
      REQUIRE_THROWS_WITH(sdk.sale->ownerOf(6), ContractErrors::AssetNotFound);
      REQUIRE_THROWS_WITH(sdk.sale->balanceOf(Address()), ContractErrors::InvalidAddress);
    }

    SECTION("ERC721 tokenURI") {
      SaleTestSuite sdk("testERC721TokenURI", openPublicSale());
      sdk.callFunction(sdk.accounts[0], 0, [&] { sdk.sale->publicMint(2); });
      REQUIRE(sdk.sale->tokenURI(0) == "ipfs://collection/0");
      REQUIRE(sdk.sale->tokenURI(1) == "ipfs://collection/1");
      REQUIRE_THROWS_WITH(sdk.sale->tokenURI(2), ContractErrors::AssetNotFound);

      sdk.asOwner([&] { sdk.sale->setBaseURI("ar://revealed/"); });
      REQUIRE(sdk.sale->tokenURI(1) == "ar://revealed/1");
      sdk.asOwner([&] { sdk.sale->setBaseURI(""); });
      REQUIRE(sdk.sale->tokenURI(1) == "");
    }

    SECTION("ERC721 burn requires privilege and ownership") {
      SaleTestSuite sdk("testERC721Burn", openPublicSale());
      const Address& holder = sdk.accounts[0];
      const Address& admin = sdk.accounts[1];
      sdk.callFunction(holder, 0, [&] { sdk.sale->publicMint(2); });
      sdk.callFunction(sdk.owner, 0, [&] { sdk.sale->publicMint(1); });

      // Holder isn't privileged.
      REQUIRE_THROWS_WITH(
        sdk.callFunction(holder, 0, [&] { sdk.sale->burn(0); }), ContractErrors::Unauthorized
      );
      // Admin is privileged but doesn't hold the token.
      sdk.asOwner([&] { sdk.sale->addAdmins({admin}); });
      REQUIRE_THROWS_WITH(
        sdk.callFunction(admin, 0, [&] { sdk.sale->burn(0); }), ContractErrors::NotAssetOwner
      );
      REQUIRE_THROWS_WITH(sdk.asOwner([&] { sdk.sale->burn(99); }), ContractErrors::AssetNotFound);

      sdk.asOwner([&] { sdk.sale->burn(2); });
      REQUIRE_FALSE(sdk.sale->exists(2));
      REQUIRE_THROWS_WITH(sdk.sale->ownerOf(2), ContractErrors::AssetNotFound);
      REQUIRE_THROWS_WITH(sdk.sale->tokenURI(2), ContractErrors::AssetNotFound);
      REQUIRE(sdk.sale->balanceOf(sdk.owner) == 0);
      REQUIRE(sdk.sale->totalSupply() == 2);
      REQUIRE(sdk.sale->totalMinted() == 3);
      REQUIRE(sdk.sale->totalBurned() == 1);
    }

    SECTION("ERC721 burning frees supply without reusing ids") {
      SaleParams params = openPublicSale();
      params.maxSupply = 3;
      SaleTestSuite sdk("testERC721BurnFreesSupply", params);
      sdk.callFunction(sdk.owner, 0, [&] { sdk.sale->publicMint(3); });
      REQUIRE_THROWS_WITH(
        sdk.callFunction(sdk.accounts[0], 0, [&] { sdk.sale->publicMint(1); }), ContractErrors::SupplyExceeded
      );
      sdk.asOwner([&] { sdk.sale->burn(1); });
      sdk.callFunction(sdk.accounts[0], 0, [&] { sdk.sale->publicMint(1); });
      REQUIRE(sdk.sale->ownerOf(3) == sdk.accounts[0]);
      REQUIRE(sdk.sale->totalSupply() == 3);
    }

    SECTION("ERC721 burned tokens stay burned after reload") {
      SaleTestSuite sdk("testERC721BurnReload", openPublicSale());
      sdk.callFunction(sdk.owner, 0, [&] { sdk.sale->publicMint(2); });
      sdk.reload();
      sdk.asOwner([&] { sdk.sale->burn(0); });
      sdk.reload();
      REQUIRE_FALSE(sdk.sale->exists(0));
      REQUIRE(sdk.sale->ownerOf(1) == sdk.owner);
      REQUIRE(sdk.sale->balanceOf(sdk.owner) == 1);
      REQUIRE(sdk.sale->totalSupply() == 1);
      REQUIRE(sdk.sale->totalBurned() == 1);
    }
  }
}
