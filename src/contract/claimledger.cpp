#include "claimledger.h"
#include "../utils/logger.h"

#include <stdexcept>

ClaimLedger::ClaimLedger(BaseContract* contract) : claims_(contract) {}

uint256_t ClaimLedger::claimed(const Address& claimant, SaleClass kind) const {
  const ClaimEntry* entry = this->claims_.find(claimant);
  if (entry == nullptr) return 0;
  return (kind == SaleClass::Whitelist) ? entry->whitelistClaimed : entry->publicClaimed;
}

void ClaimLedger::record(const Address& claimant, SaleClass kind, const uint256_t& quantity) {
  ClaimEntry& entry = this->claims_[claimant];
  uint256_t& counter = (kind == SaleClass::Whitelist) ? entry.whitelistClaimed : entry.publicClaimed;
  try {
    counter = counter + quantity;
  } catch (const std::overflow_error& e) {
    Logger::logToDebug(LogType::ERROR, Log::claimLedger, __func__,
      "Invariant violation: " + saleClassToString(kind) + " counter of "
      + claimant.hex(true).get() + " overflowed adding " + quantity.str()
    );
    throw;
  }
}

void ClaimLedger::load(const DB& db, const BaseContract& contract) {
  for (const auto& dbEntry : db.getBatch(contract.getNewPrefix("claims_"))) {
    // Value: whitelistClaimed (32 bytes) + publicClaimed (32 bytes)
    if (dbEntry.value.size() != 64) throw DynamicException(
      "ClaimLedger: corrupted entry for ", Hex::fromBytes(dbEntry.key, true).get()
    );
    BytesArrView value(dbEntry.value);
    ClaimEntry entry;
    entry.whitelistClaimed = Utils::bytesToUint256(value.subspan(0, 32));
    entry.publicClaimed = Utils::bytesToUint256(value.subspan(32, 32));
    this->claims_[Address(BytesArrView(dbEntry.key))] = entry;
  }
}

void ClaimLedger::dump(DBBatch& batch, const BaseContract& contract) const {
  const Bytes prefix = contract.getNewPrefix("claims_");
  for (const auto& [claimant, entry] : this->claims_.committed()) {
    Bytes value;
    value.reserve(64);
    Utils::appendBytes(value, Utils::uint256ToBytes(entry.whitelistClaimed));
    Utils::appendBytes(value, Utils::uint256ToBytes(entry.publicClaimed));
    batch.push_back(claimant.view(), value, prefix);
  }
}
