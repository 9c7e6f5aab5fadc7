#include "contracthost.h"
#include "errors.h"

#include <utility>

namespace {
  const Address zeroAddress;
  const uint256_t zeroValue = 0;
}

void ContractHost::snapshotBalance(const Address& address) {
  if (this->callStack_.empty()) return;
  // Only the call's first write records the balance it started from.
  this->callStack_.back().balances.try_emplace(address, this->getBalance(address));
}

void ContractHost::beginCall(const Address& caller, const uint256_t& value) {
  this->callStack_.push_back(CallFrame{caller, value, {}, {}});
}

void ContractHost::endCall(bool success) {
  CallFrame frame = std::move(this->callStack_.back());
  this->callStack_.pop_back();
  if (!success) {
    for (auto it = frame.variables.rbegin(); it != frame.variables.rend(); ++it) (*it)->rollback();
    for (const auto& [address, balance] : frame.balances) this->balances_[address] = balance;
    return;
  }
  if (this->callStack_.empty()) {
    for (SafeBase* variable : frame.variables) variable->commit();
    return;
  }
  CallFrame& parent = this->callStack_.back();
  const std::size_t parentDepth = this->callStack_.size();
  for (SafeBase* variable : frame.variables) {
    if (variable->mergeCheckpoint(parentDepth)) parent.variables.push_back(variable);
  }
  for (const auto& [address, balance] : frame.balances) parent.balances.try_emplace(address, balance);
}

void ContractHost::failCall(const std::string& reason) {
  const CallFrame& frame = this->callStack_.back();
  if (this->callStack_.size() == 1) {
    Logger::logToDebug(LogType::INFO, Log::contractHost, __func__,
      "Call from " + frame.caller.hex(true).get() + " reverted: " + reason
    );
  } else {
    Logger::logToDebug(LogType::DEBUG, Log::contractHost, __func__,
      "Nested call from " + frame.caller.hex(true).get() + " reverted: " + reason
    );
  }
  this->endCall(false);
}

uint256_t ContractHost::getBalance(const Address& address) const {
  auto it = this->balances_.find(address);
  return (it != this->balances_.end()) ? it->second : uint256_t(0);
}

void ContractHost::setBalance(const Address& address, const uint256_t& balance) {
  if (this->inTransaction()) throw DynamicException("ContractHost: can't set balances during a transaction");
  this->balances_[address] = balance;
}

void ContractHost::transfer(const Address& from, const Address& to, const uint256_t& value) {
  if (value == 0) return;
  const uint256_t fromBalance = this->getBalance(from);
  if (fromBalance < value) throw DynamicException(ContractErrors::InsufficientBalance);
  this->snapshotBalance(from);
  this->snapshotBalance(to);
  this->balances_[from] = fromBalance - value;
  this->balances_[to] = this->getBalance(to) + value;
  auto it = this->receivers_.find(to);
  if (it != this->receivers_.end()) it->second->onReceive(*this, from, value);
}

void ContractHost::registerReceiver(const Address& address, PayableReceiver& receiver) {
  this->receivers_[address] = &receiver;
}

void ContractHost::unregisterReceiver(const Address& address) {
  this->receivers_.erase(address);
}

const Address& ContractHost::getCaller() const {
  return (this->callStack_.empty()) ? zeroAddress : this->callStack_.back().caller;
}

const uint256_t& ContractHost::getValue() const {
  return (this->callStack_.empty()) ? zeroValue : this->callStack_.back().value;
}

void ContractHost::registerVariable(SafeBase& variable) {
  if (this->callStack_.empty()) return;
  const std::size_t depth = this->callStack_.size();
  if (variable.checkpointDepth() == depth) return;
  variable.checkpoint(depth);
  this->callStack_.back().variables.push_back(&variable);
}
