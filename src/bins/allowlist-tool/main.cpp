#include <fstream>
#include <iostream>
#include <regex>
#include <string>
#include <vector>

#include <boost/algorithm/string.hpp>

#include "../../contract/merkleproof.h"
#include "../../utils/options.h"

// Builds the allowlist commitment for a list of addresses (one per line,
// blank lines and '#' comments ignored) and prints the root together with
// every address's authentication path as JSON.
int main(int argc, char* argv[]) {
  std::string inputPath;
  std::string outputPath;
  if (argc > 1) {
    inputPath = argv[1];
    if (argc > 2) outputPath = argv[2];
  } else {
    std::cout << "Please type the path of the address list" << std::endl;
    std::getline(std::cin, inputPath);
    std::cout << "Please type the output file path (empty for stdout): " << std::endl;
    std::getline(std::cin, outputPath);
  }

  std::ifstream input(inputPath);
  if (!input.is_open()) {
    std::cerr << "Could not open " << inputPath << std::endl;
    return 1;
  }

  static const std::regex addressFilter("^0x[0-9a-fA-F]{40}$");
  std::vector<Address> addresses;
  std::string line;
  uint64_t lineNumber = 0;
  while (std::getline(input, line)) {
    lineNumber++;
    boost::trim(line);
    if (line.empty() || line.starts_with("#")) continue;
    if (!std::regex_match(line, addressFilter)) {
      std::cerr << "Invalid address at line " << lineNumber << ": " << line << std::endl;
      return 1;
    }
    addresses.push_back(Address::fromHex(line));
  }
  if (addresses.empty()) {
    std::cerr << "No addresses found in " << inputPath << std::endl;
    return 1;
  }

  MerkleTree tree(addresses);
  json result = json::object({
    {"root", tree.root().hex(true).get()},
    {"leaves", tree.size()},
    {"proofs", json::object()}
  });
  for (const Address& address : addresses) {
    json proof = json::array();
    for (const Hash& sibling : tree.getProof(address).value()) proof.push_back(sibling.hex(true).get());
    result["proofs"][address.hex(true).get()] = proof;
  }

  if (outputPath.empty()) {
    std::cout << result.dump(2) << std::endl;
  } else {
    std::ofstream o(outputPath);
    o << result.dump(2) << std::endl;
    o.close();
    std::cout << "Root " << tree.root().hex(true) << " for " << tree.size()
              << " address(es) written to " << outputPath << std::endl;
  }
  return 0;
}
