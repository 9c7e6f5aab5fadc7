#include "options.h"
#include "logger.h"

/**
 * Example JSON file
 *  {
 *    "rootPath": "mintgate",
 *    "name": "MintGate Genesis",
 *    "symbol": "MGG",
 *    "baseURI": "ipfs://bafybeigdyrzt5sfp7udm7hu76uh7y26nf3efuylqabf3oclgtqy55fbzdi/",
 *    "contractAddress": "0x5b5f4a1ad5ec3d5ea1a7df0fee8dec2cc2f1b8d1",
 *    "owner": "0x00dead00665771855a34155f5e7405489df2c3c6",
 *    "treasury": "0x00dead00665771855a34155f5e7405489df2c3c6",
 *    "allowlistRoot": "0x0000000000000000000000000000000000000000000000000000000000000000",
 *    "whitelistUnitPrice": "50000000000000000",
 *    "publicUnitPrice": "80000000000000000",
 *    "maxSupply": "10000",
 *    "maxWhitelistMintPerAddress": "2",
 *    "maxPublicMintPerAddress": "5",
 *    "presaleActive": false,
 *    "publicSaleActive": false,
 *    "admins": []
 *  }
 */

Options::Options(
  const std::string& rootPath, const std::string& name, const std::string& symbol,
  const std::string& baseURI, const Address& contractAddress, const Address& owner,
  const Address& treasury, const Hash& allowlistRoot,
  const uint256_t& whitelistUnitPrice, const uint256_t& publicUnitPrice,
  const uint256_t& maxSupply, const uint256_t& maxWhitelistMintPerAddress,
  const uint256_t& maxPublicMintPerAddress, const bool& presaleActive,
  const bool& publicSaleActive, const std::vector<Address>& admins
) : rootPath_(rootPath), name_(name), symbol_(symbol), baseURI_(baseURI),
  contractAddress_(contractAddress), owner_(owner), treasury_(treasury),
  allowlistRoot_(allowlistRoot), whitelistUnitPrice_(whitelistUnitPrice),
  publicUnitPrice_(publicUnitPrice), maxSupply_(maxSupply),
  maxWhitelistMintPerAddress_(maxWhitelistMintPerAddress),
  maxPublicMintPerAddress_(maxPublicMintPerAddress), presaleActive_(presaleActive),
  publicSaleActive_(publicSaleActive), admins_(admins)
{
  std::filesystem::create_directories(rootPath);
  std::ofstream o(rootPath + "/options.json");
  o << this->toJson().dump(2) << std::endl;
  o.close();
}

json Options::toJson() const {
  json options = json::object({
    {"rootPath", this->rootPath_},
    {"name", this->name_},
    {"symbol", this->symbol_},
    {"baseURI", this->baseURI_},
    {"contractAddress", this->contractAddress_.hex(true).get()},
    {"owner", this->owner_.hex(true).get()},
    {"treasury", this->treasury_.hex(true).get()},
    {"allowlistRoot", this->allowlistRoot_.hex(true).get()},
    {"whitelistUnitPrice", this->whitelistUnitPrice_.str()},
    {"publicUnitPrice", this->publicUnitPrice_.str()},
    {"maxSupply", this->maxSupply_.str()},
    {"maxWhitelistMintPerAddress", this->maxWhitelistMintPerAddress_.str()},
    {"maxPublicMintPerAddress", this->maxPublicMintPerAddress_.str()},
    {"presaleActive", this->presaleActive_},
    {"publicSaleActive", this->publicSaleActive_},
    {"admins", json::array()}
  });
  for (const auto& admin : this->admins_) {
    options["admins"].push_back(admin.hex(true).get());
  }
  return options;
}

Options Options::fromFile(const std::string& rootPath) {
  try {
    if (!std::filesystem::exists(rootPath + "/options.json")) {
      Logger::logToDebug(LogType::INFO, Log::options, __func__,
        "No options.json found at " + rootPath + ", writing defaults"
      );
      /// Defaults: closed sale with an empty allowlist, owned and funded to
      /// 0x00dead00665771855a34155f5e7405489df2c3c6.
      const Address owner = Address::fromHex("0x00dead00665771855a34155f5e7405489df2c3c6");
      return Options(
        rootPath, "MintGate Genesis", "MGG", "",
        Address::fromHex("0x5b5f4a1ad5ec3d5ea1a7df0fee8dec2cc2f1b8d1"),
        owner, owner, Hash(),
        uint256_t("50000000000000000"), uint256_t("80000000000000000"),
        uint256_t(10000), uint256_t(2), uint256_t(5),
        false, false, {}
      );
    }

    std::ifstream i(rootPath + "/options.json");
    json options;
    i >> options;
    i.close();

    std::vector<Address> admins;
    for (const auto& admin : options["admins"]) {
      admins.push_back(Address::fromHex(admin.get<std::string>()));
    }

    return Options(
      options["rootPath"].get<std::string>(),
      options["name"].get<std::string>(),
      options["symbol"].get<std::string>(),
      options["baseURI"].get<std::string>(),
      Address::fromHex(options["contractAddress"].get<std::string>()),
      Address::fromHex(options["owner"].get<std::string>()),
      Address::fromHex(options["treasury"].get<std::string>()),
      Hash::fromHex(options["allowlistRoot"].get<std::string>()),
      uint256_t(options["whitelistUnitPrice"].get<std::string>()),
      uint256_t(options["publicUnitPrice"].get<std::string>()),
      uint256_t(options["maxSupply"].get<std::string>()),
      uint256_t(options["maxWhitelistMintPerAddress"].get<std::string>()),
      uint256_t(options["maxPublicMintPerAddress"].get<std::string>()),
      options["presaleActive"].get<bool>(),
      options["publicSaleActive"].get<bool>(),
      admins
    );
  } catch (std::exception &e) {
    Logger::logToDebug(LogType::ERROR, Log::options, __func__,
      "Could not load options from " + rootPath + ": " + e.what()
    );
    throw DynamicException("Could not load options from ", rootPath, ": ", e.what());
  }
}
