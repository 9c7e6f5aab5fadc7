#include "basecontract.h"
#include "contracthost.h"

namespace {
  Bytes makeDBPrefix(const Address& address) {
    Bytes prefix = DBPrefix::contracts;
    Utils::appendBytes(prefix, address.get());
    return prefix;
  }
}

void registerVariableUse(BaseContract& contract, SafeBase& variable) {
  contract.registerVariableUse(variable);
}

BaseContract::BaseContract(
  const std::string& contractName, ContractHost& host,
  const Address& address, const Address& creator, DB& db
) : host_(host), contractAddress_(address), dbPrefix_(makeDBPrefix(address)),
  contractName_(contractName), contractCreator_(creator), db_(db)
{}

BaseContract::BaseContract(ContractHost& host, const Address& address, DB& db)
  : host_(host), contractAddress_(address), dbPrefix_(makeDBPrefix(address)),
  contractName_(Utils::bytesToString(db.get(std::string("contractName_"), makeDBPrefix(address)))),
  contractCreator_(BytesArrView(db.get(std::string("contractCreator_"), makeDBPrefix(address)))),
  db_(db)
{}

BaseContract::~BaseContract() {
  this->db_.put(std::string("contractName_"), Utils::create_view_span(this->contractName_), this->dbPrefix_);
  this->db_.put(std::string("contractCreator_"), this->contractCreator_.view(), this->dbPrefix_);
}

Bytes BaseContract::getNewPrefix(const std::string& newPrefix) const {
  Bytes prefix = this->dbPrefix_;
  Utils::appendBytes(prefix, newPrefix);
  return prefix;
}

const Address& BaseContract::getCaller() const { return this->host_.getCaller(); }

const uint256_t& BaseContract::getValue() const { return this->host_.getValue(); }

uint256_t BaseContract::getBalance() const { return this->host_.getBalance(this->contractAddress_); }

void BaseContract::sendTokens(const Address& to, const uint256_t& amount) {
  this->host_.transfer(this->contractAddress_, to, amount);
}

void BaseContract::registerVariableUse(SafeBase& variable) {
  this->host_.registerVariable(variable);
}
