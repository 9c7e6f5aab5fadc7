#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <boost/algorithm/string.hpp>

#include "../../contract/contracthost.h"
#include "../../contract/templates/allowlistmint.h"
#include "../../utils/db.h"
#include "../../utils/logger.h"
#include "../../utils/options.h"

namespace {
  SaleParams paramsFromOptions(const Options& options) {
    SaleParams params;
    params.presaleActive = options.getPresaleActive();
    params.publicSaleActive = options.getPublicSaleActive();
    params.whitelistUnitPrice = options.getWhitelistUnitPrice();
    params.publicUnitPrice = options.getPublicUnitPrice();
    params.maxSupply = options.getMaxSupply();
    params.maxWhitelistMintPerAddress = options.getMaxWhitelistMintPerAddress();
    params.maxPublicMintPerAddress = options.getMaxPublicMintPerAddress();
    return params;
  }

  void printStatus(const AllowlistMint& sale) {
    std::cout << sale.name() << " (" << sale.symbol() << ") at " << sale.getContractAddress().hex(true) << std::endl;
    std::cout << "  owner:          " << sale.owner().hex(true) << std::endl;
    std::cout << "  treasury:       " << sale.treasury().hex(true) << std::endl;
    std::cout << "  allowlist root: " << sale.allowlistRoot().hex(true) << std::endl;
    std::cout << "  presale:        " << (sale.presaleActive() ? "open" : "closed")
              << ", price " << sale.unitPrice(SaleClass::Whitelist).str()
              << ", cap " << sale.perAddressCap(SaleClass::Whitelist).str() << std::endl;
    std::cout << "  public sale:    " << (sale.publicSaleActive() ? "open" : "closed")
              << ", price " << sale.unitPrice(SaleClass::Public).str()
              << ", cap " << sale.perAddressCap(SaleClass::Public).str() << std::endl;
    std::cout << "  supply:         " << sale.totalSupply().str() << " / " << sale.maxSupply().str() << std::endl;
    std::cout << "  paused:         " << (sale.paused() ? "yes" : "no") << std::endl;
  }

  std::vector<Hash> parseProof(const std::string& proofStr) {
    std::vector<Hash> proof;
    if (proofStr.empty()) return proof;
    std::vector<std::string> parts;
    boost::split(parts, proofStr, boost::is_any_of(","));
    for (const auto& part : parts) proof.push_back(Hash::fromHex(part));
    return proof;
  }
}

// Loads (or deploys, on first run) the sale contract described by
// <rootPath>/options.json and serves a read-only inspection console.
int main(int argc, char* argv[]) {
  Utils::logToCout = true;
  std::string rootPath = (argc > 1) ? argv[1] : "";
  if (rootPath.empty()) {
    std::cout << "Please type the data directory (empty for default: mintgate): " << std::endl;
    std::getline(std::cin, rootPath);
    if (rootPath.empty()) rootPath = "mintgate";
  }

  try {
    const Options options = Options::fromFile(rootPath);
    Logger::setLogFile(rootPath + "/debug.txt");
    DB db(rootPath + "/db");
    ContractHost host;

    std::unique_ptr<AllowlistMint> sale;
    Bytes contractPrefix = DBPrefix::contracts;
    Utils::appendBytes(contractPrefix, options.getContractAddress().get());
    if (db.has(std::string("contractName_"), contractPrefix)) {
      Logger::logToDebug(LogType::INFO, Log::mintgated, __func__, "Loading sale contract from DB");
      sale = std::make_unique<AllowlistMint>(host, options.getContractAddress(), db);
    } else {
      Logger::logToDebug(LogType::INFO, Log::mintgated, __func__, "Deploying sale contract from options");
      sale = std::make_unique<AllowlistMint>(
        options.getName(), options.getSymbol(), options.getBaseURI(),
        paramsFromOptions(options), options.getAllowlistRoot(), options.getTreasury(),
        options.getAdmins(), host, options.getContractAddress(), options.getOwner(), db
      );
    }
    printStatus(*sale);

    std::cout << "Commands: status | claims <address> | eligible <address> <proof,...> | owner <id> | uri <id> | exit" << std::endl;
    std::string line;
    while (std::getline(std::cin, line)) {
      boost::trim(line);
      if (line.empty()) continue;
      std::vector<std::string> args;
      boost::split(args, line, boost::is_any_of(" "), boost::token_compress_on);
      try {
        if (args[0] == "exit") {
          break;
        } else if (args[0] == "status") {
          printStatus(*sale);
        } else if (args[0] == "claims" && args.size() == 2) {
          Address account = Address::fromHex(args[1]);
          std::cout << "whitelist: " << sale->whitelistClaimed(account).str()
                    << " public: " << sale->publicClaimed(account).str() << std::endl;
        } else if (args[0] == "eligible" && args.size() >= 2) {
          Address account = Address::fromHex(args[1]);
          std::vector<Hash> proof = parseProof((args.size() > 2) ? args[2] : "");
          std::cout << (sale->isEligible(proof, account) ? "eligible" : "not eligible") << std::endl;
        } else if (args[0] == "owner" && args.size() == 2) {
          std::cout << sale->ownerOf(uint256_t(args[1])).hex(true) << std::endl;
        } else if (args[0] == "uri" && args.size() == 2) {
          std::cout << sale->tokenURI(uint256_t(args[1])) << std::endl;
        } else {
          std::cout << "Unknown command: " << line << std::endl;
        }
      } catch (const std::exception& e) {
        std::cout << "Error: " << e.what() << std::endl;
      }
    }
  } catch (const std::exception& e) {
    std::cerr << "mintgated failed: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
