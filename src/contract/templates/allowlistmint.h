#ifndef ALLOWLIST_MINT_H
#define ALLOWLIST_MINT_H

#include <string>
#include <vector>

// AllowlistMint derives from base ERC721
#include "erc721.h"
#include "../accesscontrol.h"
#include "../claimledger.h"
#include "../merkleproof.h"
#include "../saleconfig.h"
#include "../variables/reentrancyguard.h"
#include "../variables/safevalue.h"

/**
 * Two-phase sale of a fixed-supply ERC721 collection.
 * The presale is restricted to addresses in a Merkle allowlist; the public
 * sale is open to anyone. Each phase has its own price and per-address cap,
 * both share the global supply ceiling. Every payment is forwarded in full
 * to the treasury.
 */
class AllowlistMint : public ERC721 {
  private:
    SaleConfig config_; ///< Phase flags, prices and ceilings.
    ClaimLedger claims_; ///< Per-address claim counters.
    AdminRegistry access_; ///< Owner and admin set.
    SafeHashValue allowlistRoot_; ///< Merkle root of the presale allowlist.
    SafeAddress treasury_; ///< Destination of every mint payment.
    SafeBool paused_; ///< Whether minting is paused.
    SafeString tokenBaseURI_; ///< Base URI for token metadata.
    bool reentrancyLock_ = false; ///< Held while a mint is in progress.

    /// Throws "Unauthorized" unless the caller is the owner or an admin.
    void onlyPrivileged() const;

    /// Throws "Paused" while minting is paused.
    void whenNotPaused() const;

    /**
     * Shared body of whitelistMint() and publicMint().
     * Every check runs before any write; the payment is forwarded before the
     * claim is recorded and the tokens are minted.
     * @param kind The buyer class.
     * @param quantity How many tokens to mint.
     * @param proof Allowlist proof, only read for SaleClass::Whitelist.
     */
    void mintFor(SaleClass kind, const uint256_t& quantity, const std::vector<Hash>& proof);

    std::string baseURI_() const override { return this->tokenBaseURI_.get(); }

    void commitState();

    void enableRegisterState();

  public:
    /**
     * Constructor to be used when creating a new contract.
     * @param erc721name The collection name.
     * @param erc721symbol The collection symbol.
     * @param baseURI The initial metadata base URI.
     * @param params The initial sale parameters.
     * @param allowlistRoot The initial allowlist Merkle root.
     * @param treasury The address receiving mint payments.
     * @param admins The initial admin set.
     * @param host The host running the contract.
     * @param address The address where the contract will be deployed.
     * @param creator The deployer, who becomes the owner.
     * @param db Reference to the database object.
     */
    AllowlistMint(
      const std::string& erc721name, const std::string& erc721symbol, const std::string& baseURI,
      const SaleParams& params, const Hash& allowlistRoot, const Address& treasury,
      const std::vector<Address>& admins,
      ContractHost& host, const Address& address, const Address& creator, DB& db
    );

    /**
     * Constructor for loading contract from DB.
     * @param host The host running the contract.
     * @param address The address where the contract is deployed.
     * @param db Reference to the database object.
     */
    AllowlistMint(ContractHost& host, const Address& address, DB& db);

    /// Destructor. Saves the sale state to the DB.
    ~AllowlistMint() override;

    /**
     * Presale mint for the caller. Payable.
     * @param quantity How many tokens to mint.
     * @param proof The caller's allowlist authentication path.
     * @throw DynamicException "Paused", "PhaseInactive", "NotEligible",
     *        "PerAddressCapExceeded", "InsufficientPayment", "SupplyExceeded"
     *        or "ReentrantCall", checked in that order.
     */
    void whitelistMint(const uint256_t& quantity, const std::vector<Hash>& proof);

    /// Public sale mint for the caller. Payable. Same checks as whitelistMint() minus the proof.
    void publicMint(const uint256_t& quantity);

    /// Whether `account` is in the current allowlist. Works in any phase, paused or not.
    bool isEligible(const std::vector<Hash>& proof, const Address& account) const;

    // Privileged (owner or admin) functions, all throw "Unauthorized" otherwise.
    void setAllowlistRoot(const Hash& root);
    void setTreasury(const Address& treasury);
    void setUnitPrice(SaleClass kind, const uint256_t& amount);
    void setMaxSupply(const uint256_t& maxSupply);
    void setPerAddressCap(SaleClass kind, const uint256_t& cap);
    void setPhase(bool presale, bool publicSale);
    void setPreSale(bool active);
    void switchToPublicPhase();
    void addAdmins(const std::vector<Address>& admins);
    void removeAdmins(const std::vector<Address>& admins);
    void pause();
    void unpause();
    void setBaseURI(const std::string& baseURI);

    /**
     * Burn a token. Privileged, and the caller must also own the token.
     * @throw DynamicException "Unauthorized", "AssetNotFound" or "NotAssetOwner".
     */
    void burn(const uint256_t& tokenId);

    /**
     * Hand the contract over to a new owner. Owner only.
     * @throw DynamicException "Unauthorized" or "InvalidAddress".
     */
    void transferOwnership(const Address& newOwner);

    bool presaleActive() const { return this->config_.presaleActive(); }
    bool publicSaleActive() const { return this->config_.publicSaleActive(); }
    uint256_t unitPrice(SaleClass kind) const { return this->config_.unitPrice(kind); }
    uint256_t maxSupply() const { return this->config_.maxSupply(); }
    uint256_t perAddressCap(SaleClass kind) const { return this->config_.perAddressCap(kind); }
    SaleParams saleParams() const { return this->config_.params(); }
    Hash allowlistRoot() const { return this->allowlistRoot_.get(); }
    Address treasury() const { return this->treasury_.get(); }
    bool paused() const { return this->paused_.get(); }
    Address owner() const { return this->access_.owner(); }
    bool isAdmin(const Address& account) const { return this->access_.isAdmin(account); }
    std::vector<Address> admins() const { return this->access_.admins(); }
    uint256_t whitelistClaimed(const Address& account) const { return this->claims_.claimed(account, SaleClass::Whitelist); }
    uint256_t publicClaimed(const Address& account) const { return this->claims_.claimed(account, SaleClass::Public); }
    std::string baseURI() const { return this->tokenBaseURI_.get(); }

    /// The capability check gating privileged functions.
    const AccessControl& accessControl() const { return this->access_; }
};

#endif // ALLOWLIST_MINT_H
