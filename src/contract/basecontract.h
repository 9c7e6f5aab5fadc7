#ifndef BASECONTRACT_H
#define BASECONTRACT_H

#include <string>
#include <vector>

#include "variables/safebase.h"
#include "../utils/db.h"
#include "../utils/strings.h"
#include "../utils/utils.h"

class ContractHost; // Forward declaration.

/**
 * Base class for all contracts.
 * Holds the contract's identity and DB prefix. Safe variables written during
 * a call are reported to the host, which commits or reverts them.
 */
class BaseContract {
  private:
    ContractHost& host_; ///< Host running the contract's calls.
    const Address contractAddress_; ///< Address where the contract is deployed.
    const Bytes dbPrefix_; ///< Prefix of every DB key owned by the contract.
    const std::string contractName_; ///< Name of the contract type.
    const Address contractCreator_; ///< Address that deployed the contract.

  protected:
    DB& db_; ///< Reference to the database.

  public:
    /**
     * Constructor for a new contract.
     * @param contractName The contract type name.
     * @param host The host running the contract.
     * @param address The address where the contract is deployed.
     * @param creator The deployer's address.
     * @param db The database.
     */
    BaseContract(
      const std::string& contractName, ContractHost& host,
      const Address& address, const Address& creator, DB& db
    );

    /**
     * Constructor for loading a contract from the DB.
     * @param host The host running the contract.
     * @param address The address where the contract is deployed.
     * @param db The database.
     */
    BaseContract(ContractHost& host, const Address& address, DB& db);

    BaseContract(const BaseContract&) = delete;
    BaseContract& operator=(const BaseContract&) = delete;

    /// Destructor. Saves the contract's identity to the DB.
    virtual ~BaseContract();

    const Address& getContractAddress() const { return this->contractAddress_; }
    const Address& getContractCreator() const { return this->contractCreator_; }
    const std::string& getContractName() const { return this->contractName_; }
    const Bytes& getDBPrefix() const { return this->dbPrefix_; }

    /**
     * Build a sub-prefix for a named collection of this contract.
     * @param newPrefix The collection name.
     */
    Bytes getNewPrefix(const std::string& newPrefix) const;

    /// Caller of the current call (zero address outside a call).
    const Address& getCaller() const;

    /// Native value attached to the current call.
    const uint256_t& getValue() const;

    /// Native balance held by this contract.
    uint256_t getBalance() const;

    /// The host running this contract.
    ContractHost& getHost() const { return this->host_; }

    /**
     * Send native value from this contract to another address.
     * The recipient's receive hook, if any, runs before this returns.
     */
    void sendTokens(const Address& to, const uint256_t& amount);

    /// Hand a safe variable written by the current call over to the host.
    void registerVariableUse(SafeBase& variable);
};

#endif // BASECONTRACT_H
