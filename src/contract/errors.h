#ifndef CONTRACT_ERRORS_H
#define CONTRACT_ERRORS_H

#include <string>

/**
 * Condition names thrown (as DynamicException messages) by contract calls.
 * Every one of them aborts the whole call with no state change.
 */
namespace ContractErrors {
  const std::string PhaseInactive = "PhaseInactive";
  const std::string NotEligible = "NotEligible";
  const std::string PerAddressCapExceeded = "PerAddressCapExceeded";
  const std::string InsufficientPayment = "InsufficientPayment";
  const std::string SupplyExceeded = "SupplyExceeded";
  const std::string Unauthorized = "Unauthorized";
  const std::string AssetNotFound = "AssetNotFound";
  const std::string NotAssetOwner = "NotAssetOwner";
  const std::string Paused = "Paused";
  const std::string ReentrantCall = "ReentrantCall";
  const std::string MintZeroQuantity = "MintZeroQuantity";
  const std::string MintToZeroAddress = "MintToZeroAddress";
  const std::string InsufficientBalance = "InsufficientBalance";
  const std::string InvalidAddress = "InvalidAddress";
}

#endif // CONTRACT_ERRORS_H
