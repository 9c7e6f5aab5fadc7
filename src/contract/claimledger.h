#ifndef CLAIMLEDGER_H
#define CLAIMLEDGER_H

#include "basecontract.h"
#include "saleconfig.h"
#include "variables/safeunorderedmap.h"

/// Cumulative claims of one address, one counter per buyer class.
struct ClaimEntry {
  uint256_t whitelistClaimed = 0;
  uint256_t publicClaimed = 0;
};

/**
 * Per-address claim counters.
 * Entries are created on an address's first claim and never removed;
 * counters only grow.
 */
class ClaimLedger {
  private:
    SafeUnorderedMap<Address, ClaimEntry> claims_;

  public:
    /**
     * Constructor.
     * @param contract The contract owning the ledger's state.
     */
    explicit ClaimLedger(BaseContract* contract);

    /// Whether `claimant` has claimed at least once.
    bool hasEntry(const Address& claimant) const { return this->claims_.contains(claimant); }

    /// Both counters of `claimant` (zeroes if it never claimed).
    ClaimEntry entry(const Address& claimant) const { return this->claims_.get(claimant); }

    /// Counter of `claimant` for `kind`.
    uint256_t claimed(const Address& claimant, SaleClass kind) const;

    /**
     * Add `quantity` to the `kind` counter of `claimant`.
     * Callers check the per-address cap first, so an overflow here means a
     * broken invariant; it is logged and rethrown as std::overflow_error.
     */
    void record(const Address& claimant, SaleClass kind, const uint256_t& quantity);

    /// Number of committed entries.
    std::size_t size() const { return this->claims_.committed().size(); }

    void load(const DB& db, const BaseContract& contract);

    void dump(DBBatch& batch, const BaseContract& contract) const;

    void commit() { this->claims_.commit(); }

    void enableRegister() { this->claims_.enableRegister(); }
};

#endif // CLAIMLEDGER_H
