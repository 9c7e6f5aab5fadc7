#ifndef CONTRACTHOST_H
#define CONTRACTHOST_H

#include <exception>
#include <functional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include "basecontract.h"
#include "../utils/logger.h"
#include "../utils/safehash.h"
#include "../utils/strings.h"

class ContractHost; // Forward declaration.

/**
 * Interface for addresses that run code when they receive native value.
 * The hook runs synchronously inside the transfer and may call back into
 * contracts through ContractHost::call().
 */
class PayableReceiver {
  public:
    virtual ~PayableReceiver() = default;

    /**
     * Called after the value has been credited to the receiver.
     * Throwing aborts the whole transaction the transfer belongs to.
     * @param host The host performing the transfer.
     * @param from The sender.
     * @param value The amount received.
     */
    virtual void onReceive(ContractHost& host, const Address& from, const uint256_t& value) = 0;
};

/**
 * Execution substrate for contract calls.
 * Keeps native balances and the caller/value context, and runs each
 * top-level call as one transaction: every safe variable and balance touched
 * is committed if the call returns and reverted if it throws.
 * Calls made from inside a receive hook are nested in the outer transaction:
 * if one throws, only its own changes (attached value included) are undone.
 */
class ContractHost {
  private:
    /// A call in progress and everything it changed.
    struct CallFrame {
      Address caller;
      uint256_t value;
      std::vector<SafeBase*> variables; ///< Variables checkpointed by this call.
      std::unordered_map<Address, uint256_t, SafeHash> balances; ///< Balances before this call first changed them.
    };

    std::unordered_map<Address, uint256_t, SafeHash> balances_; ///< Native balances.
    std::unordered_map<Address, PayableReceiver*, SafeHash> receivers_; ///< Registered receive hooks.
    std::vector<CallFrame> callStack_; ///< Calls in progress, innermost last.

    void snapshotBalance(const Address& address);

    void beginCall(const Address& caller, const uint256_t& value);

    /**
     * Close the innermost call.
     * A failed call rolls back its own writes and transfers at any depth.
     * A successful nested call hands them over to its parent, and the
     * outermost call commits them.
     */
    void endCall(bool success);

    /// Handle a failed call.
    void failCall(const std::string& reason);

  public:
    ContractHost() = default;

    ContractHost(const ContractHost&) = delete;
    ContractHost& operator=(const ContractHost&) = delete;

    /// Native balance of an address.
    uint256_t getBalance(const Address& address) const;

    /**
     * Set the native balance of an address directly (genesis funding).
     * @throw DynamicException if called during a transaction.
     */
    void setBalance(const Address& address, const uint256_t& balance);

    /**
     * Move native value between two addresses, then run the receiver's hook.
     * @throw DynamicException "InsufficientBalance" if `from` can't cover the amount.
     */
    void transfer(const Address& from, const Address& to, const uint256_t& value);

    /// Register a receive hook for an address. The receiver must outlive the registration.
    void registerReceiver(const Address& address, PayableReceiver& receiver);

    /// Remove a receive hook.
    void unregisterReceiver(const Address& address);

    /// Caller of the innermost call in progress (zero address if idle).
    const Address& getCaller() const;

    /// Value attached to the innermost call in progress (zero if idle).
    const uint256_t& getValue() const;

    /// Whether a transaction is in progress.
    bool inTransaction() const { return !this->callStack_.empty(); }

    /**
     * Track a safe variable written by the innermost call, saving its
     * pending state the first time that call writes it.
     * Writes made outside a call are not tracked.
     */
    void registerVariable(SafeBase& variable);

    /**
     * Run a contract function as a call from `caller` with `value` attached.
     * The value moves from the caller to the contract before the function runs.
     * @param caller The calling address.
     * @param contract The contract being called.
     * @param value The native value attached to the call.
     * @param func The function to run, usually a lambda calling a contract method.
     * @return Whatever `func` returns.
     * @throw Rethrows whatever `func` throws, after reverting everything the call changed.
     */
    template <typename Func> auto call(
      const Address& caller, BaseContract& contract, const uint256_t& value, Func&& func
    ) -> std::invoke_result_t<Func> {
      this->beginCall(caller, value);
      try {
        this->transfer(caller, contract.getContractAddress(), value);
        if constexpr (std::is_void_v<std::invoke_result_t<Func>>) {
          std::invoke(std::forward<Func>(func));
          this->endCall(true);
        } else {
          auto ret = std::invoke(std::forward<Func>(func));
          this->endCall(true);
          return ret;
        }
      } catch (const std::exception& e) {
        this->failCall(e.what());
        throw;
      }
    }
};

#endif // CONTRACTHOST_H
