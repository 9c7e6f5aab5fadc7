#ifndef OPTIONS_H
#define OPTIONS_H

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "strings.h"
#include "utils.h"

using json = nlohmann::ordered_json;

/// Deployment parameters of a sale contract, stored in `<rootPath>/options.json`.
class Options {
  private:
    const std::string rootPath_; ///< Path to the data directory (DB and options.json).
    const std::string name_; ///< Token collection name.
    const std::string symbol_; ///< Token collection symbol.
    const std::string baseURI_; ///< Initial metadata base URI.
    const Address contractAddress_; ///< Address the sale contract is deployed at.
    const Address owner_; ///< Owner (and deployer) of the sale contract.
    const Address treasury_; ///< Initial treasury receiving all mint payments.
    const Hash allowlistRoot_; ///< Initial allowlist Merkle root.
    const uint256_t whitelistUnitPrice_; ///< Presale price per token, in wei.
    const uint256_t publicUnitPrice_; ///< Public sale price per token, in wei.
    const uint256_t maxSupply_; ///< Global issuance ceiling.
    const uint256_t maxWhitelistMintPerAddress_; ///< Presale cap per address.
    const uint256_t maxPublicMintPerAddress_; ///< Public sale cap per address.
    const bool presaleActive_; ///< Whether the presale starts open.
    const bool publicSaleActive_; ///< Whether the public sale starts open.
    const std::vector<Address> admins_; ///< Initial admin set.

  public:
    /**
     * Constructor. Also writes the options to `<rootPath>/options.json`.
     */
    Options(
      const std::string& rootPath, const std::string& name, const std::string& symbol,
      const std::string& baseURI, const Address& contractAddress, const Address& owner,
      const Address& treasury, const Hash& allowlistRoot,
      const uint256_t& whitelistUnitPrice, const uint256_t& publicUnitPrice,
      const uint256_t& maxSupply, const uint256_t& maxWhitelistMintPerAddress,
      const uint256_t& maxPublicMintPerAddress, const bool& presaleActive,
      const bool& publicSaleActive, const std::vector<Address>& admins
    );

    const std::string& getRootPath() const { return this->rootPath_; }
    const std::string& getName() const { return this->name_; }
    const std::string& getSymbol() const { return this->symbol_; }
    const std::string& getBaseURI() const { return this->baseURI_; }
    const Address& getContractAddress() const { return this->contractAddress_; }
    const Address& getOwner() const { return this->owner_; }
    const Address& getTreasury() const { return this->treasury_; }
    const Hash& getAllowlistRoot() const { return this->allowlistRoot_; }
    const uint256_t& getWhitelistUnitPrice() const { return this->whitelistUnitPrice_; }
    const uint256_t& getPublicUnitPrice() const { return this->publicUnitPrice_; }
    const uint256_t& getMaxSupply() const { return this->maxSupply_; }
    const uint256_t& getMaxWhitelistMintPerAddress() const { return this->maxWhitelistMintPerAddress_; }
    const uint256_t& getMaxPublicMintPerAddress() const { return this->maxPublicMintPerAddress_; }
    const bool& getPresaleActive() const { return this->presaleActive_; }
    const bool& getPublicSaleActive() const { return this->publicSaleActive_; }
    const std::vector<Address>& getAdmins() const { return this->admins_; }

    /// Serialize the options to JSON.
    json toJson() const;

    /**
     * Load the options from `<rootPath>/options.json`.
     * If the file doesn't exist, a default set is written and returned.
     * @param rootPath The data directory.
     * @throw DynamicException if the file can't be parsed.
     */
    static Options fromFile(const std::string& rootPath);
};

#endif // OPTIONS_H
