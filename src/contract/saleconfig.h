#ifndef SALECONFIG_H
#define SALECONFIG_H

#include <string>

#include "basecontract.h"
#include "variables/safeuint256.h"
#include "variables/safevalue.h"

/// Buyer class of a mint. Each class has its own phase flag, price and per-address cap.
enum class SaleClass { Whitelist, Public };

/// Human-readable name of a SaleClass.
std::string saleClassToString(SaleClass kind);

/// Plain copy of every sale parameter, used at deployment and for snapshots.
struct SaleParams {
  bool presaleActive = false;
  bool publicSaleActive = false;
  uint256_t whitelistUnitPrice = 0;
  uint256_t publicUnitPrice = 0;
  uint256_t maxSupply = 0;
  uint256_t maxWhitelistMintPerAddress = 0;
  uint256_t maxPublicMintPerAddress = 0;
};

/**
 * Phase flags, prices and ceilings of the sale.
 * Both phase flags may be true or false at the same time; only
 * switchToPublicPhase() moves them together.
 */
class SaleConfig {
  private:
    SafeBool presaleActive_;
    SafeBool publicSaleActive_;
    SafeUint256_t whitelistUnitPrice_;
    SafeUint256_t publicUnitPrice_;
    SafeUint256_t maxSupply_;
    SafeUint256_t maxWhitelistMintPerAddress_;
    SafeUint256_t maxPublicMintPerAddress_;

  public:
    /**
     * Constructor.
     * @param contract The contract owning the config's state.
     * @param params The initial parameters.
     */
    SaleConfig(BaseContract* contract, const SaleParams& params);

    bool presaleActive() const { return this->presaleActive_.get(); }
    bool publicSaleActive() const { return this->publicSaleActive_.get(); }
    const uint256_t& maxSupply() const { return this->maxSupply_.get(); }

    /// Whether the phase selling to `kind` is open.
    bool isPhaseActive(SaleClass kind) const;

    /// Price per token for `kind`.
    const uint256_t& unitPrice(SaleClass kind) const;

    /// Maximum cumulative claims per address for `kind`.
    const uint256_t& perAddressCap(SaleClass kind) const;

    /// Snapshot of every parameter.
    SaleParams params() const;

    void setPresale(bool active);
    void setPublicSale(bool active);
    void setPhase(bool presale, bool publicSale);

    /// Close the presale and open the public sale in one step.
    void switchToPublicPhase();

    void setUnitPrice(SaleClass kind, const uint256_t& amount);
    void setMaxSupply(const uint256_t& maxSupply);
    void setPerAddressCap(SaleClass kind, const uint256_t& cap);

    /// Load the committed state from the DB.
    void load(const DB& db, const BaseContract& contract);

    /// Write the committed state into a batch.
    void dump(DBBatch& batch, const BaseContract& contract) const;

    void commit();

    void enableRegister();
};

#endif // SALECONFIG_H
