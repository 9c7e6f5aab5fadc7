#ifndef ERC721_H
#define ERC721_H

#include <string>
#include <vector>

#include "../basecontract.h"
#include "../variables/safeuint256.h"
#include "../variables/safeunorderedmap.h"
#include "../variables/safevalue.h"

/**
 * Minimal ERC721 token ledger with sequential ids starting at zero.
 * Tracks ownership and the running issued count; derived contracts decide
 * who may call mint_() and burn_(). Transfers and approvals are not part
 * of this ledger.
 */
class ERC721 : public BaseContract {
  private:
    SafeString name_; ///< Collection name.
    SafeString symbol_; ///< Collection symbol.
    SafeUint256_t currentIndex_; ///< Next token id to be minted (also the total ever minted).
    SafeUint256_t burnCounter_; ///< How many tokens were burned.
    SafeUnorderedMap<uint256_t, Address> owners_; ///< tokenId => owner.
    SafeUnorderedMap<Address, uint256_t> balances_; ///< owner => token count.

  protected:
    /**
     * Mint `quantity` consecutive tokens to `to`.
     * @return The id of the first minted token.
     * @throw DynamicException "MintToZeroAddress" or "MintZeroQuantity".
     */
    uint256_t mint_(const Address& to, const uint256_t& quantity);

    /**
     * Burn a token, freeing one unit of supply.
     * @throw DynamicException "AssetNotFound" if the token doesn't exist.
     */
    void burn_(const uint256_t& tokenId);

    /// Prefix of every tokenURI(). Empty by default.
    virtual std::string baseURI_() const { return ""; }

  public:
    /**
     * Constructor for a new contract.
     * @param contractName The contract type name.
     * @param erc721name The collection name.
     * @param erc721symbol The collection symbol.
     * @param host The host running the contract.
     * @param address The address where the contract is deployed.
     * @param creator The deployer's address.
     * @param db The database.
     */
    ERC721(
      const std::string& contractName, const std::string& erc721name, const std::string& erc721symbol,
      ContractHost& host, const Address& address, const Address& creator, DB& db
    );

    /// Constructor for loading the contract from the DB.
    ERC721(ContractHost& host, const Address& address, DB& db);

    /// Destructor. Saves the ledger to the DB.
    ~ERC721() override;

    std::string name() const { return this->name_.get(); }

    std::string symbol() const { return this->symbol_.get(); }

    /// Tokens currently in existence (minted minus burned).
    uint256_t totalSupply() const { return this->currentIndex_.get() - this->burnCounter_.get(); }

    /// Tokens ever minted.
    uint256_t totalMinted() const { return this->currentIndex_.get(); }

    /// Tokens ever burned.
    uint256_t totalBurned() const { return this->burnCounter_.get(); }

    /// Whether a token exists (minted and not burned).
    bool exists(const uint256_t& tokenId) const { return this->owners_.contains(tokenId); }

    /**
     * Number of tokens held by `owner`.
     * @throw DynamicException "InvalidAddress" for the zero address.
     */
    uint256_t balanceOf(const Address& owner) const;

    /**
     * Owner of a token.
     * @throw DynamicException "AssetNotFound" if the token doesn't exist.
     */
    Address ownerOf(const uint256_t& tokenId) const;

    /**
     * Metadata URI of a token: base URI followed by the decimal id, or an
     * empty string when no base URI is set.
     * @throw DynamicException "AssetNotFound" if the token doesn't exist.
     */
    virtual std::string tokenURI(const uint256_t& tokenId) const;

    /// Ids held by `owner`, ascending.
    std::vector<uint256_t> tokensOfOwner(const Address& owner) const;
};

#endif // ERC721_H
