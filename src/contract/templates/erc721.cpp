#include "erc721.h"
#include "../errors.h"
#include "../../utils/logger.h"

#include <algorithm>

ERC721::ERC721(
  const std::string& contractName, const std::string& erc721name, const std::string& erc721symbol,
  ContractHost& host, const Address& address, const Address& creator, DB& db
) : BaseContract(contractName, host, address, creator, db),
  name_(this, erc721name), symbol_(this, erc721symbol), currentIndex_(this, 0), burnCounter_(this, 0),
  owners_(this), balances_(this)
{
  this->name_.commit();
  this->symbol_.commit();
  this->currentIndex_.commit();
  this->burnCounter_.commit();

  this->name_.enableRegister();
  this->symbol_.enableRegister();
  this->currentIndex_.enableRegister();
  this->burnCounter_.enableRegister();
  this->owners_.enableRegister();
  this->balances_.enableRegister();
}

ERC721::ERC721(ContractHost& host, const Address& address, DB& db)
  : BaseContract(host, address, db),
  name_(this), symbol_(this), currentIndex_(this), burnCounter_(this), owners_(this), balances_(this)
{
  this->name_ = Utils::bytesToString(this->db_.get(std::string("name_"), this->getDBPrefix()));
  this->symbol_ = Utils::bytesToString(this->db_.get(std::string("symbol_"), this->getDBPrefix()));
  this->currentIndex_ = Utils::bytesToUint256(this->db_.get(std::string("currentIndex_"), this->getDBPrefix()));
  this->burnCounter_ = Utils::bytesToUint256(this->db_.get(std::string("burnCounter_"), this->getDBPrefix()));
  for (const auto& dbEntry : this->db_.getBatch(this->getNewPrefix("owners_"))) {
    this->owners_[Utils::bytesToUint256(dbEntry.key)] = Address(BytesArrView(dbEntry.value));
  }
  for (const auto& dbEntry : this->db_.getBatch(this->getNewPrefix("balances_"))) {
    this->balances_[Address(BytesArrView(dbEntry.key))] = Utils::bytesToUint256(dbEntry.value);
  }

  this->name_.commit();
  this->symbol_.commit();
  this->currentIndex_.commit();
  this->burnCounter_.commit();
  this->owners_.commit();
  this->balances_.commit();

  this->name_.enableRegister();
  this->symbol_.enableRegister();
  this->currentIndex_.enableRegister();
  this->burnCounter_.enableRegister();
  this->owners_.enableRegister();
  this->balances_.enableRegister();
}

ERC721::~ERC721() {
  DBBatch batch;
  const Bytes& prefix = this->getDBPrefix();
  batch.push_back(Utils::create_view_span(std::string("name_")), Utils::create_view_span(this->name_.get()), prefix);
  batch.push_back(Utils::create_view_span(std::string("symbol_")), Utils::create_view_span(this->symbol_.get()), prefix);
  batch.push_back(Utils::create_view_span(std::string("currentIndex_")), Utils::uint256ToBytes(this->currentIndex_.get()), prefix);
  batch.push_back(Utils::create_view_span(std::string("burnCounter_")), Utils::uint256ToBytes(this->burnCounter_.get()), prefix);

  // Burned tokens and emptied balances must not survive a reload.
  const Bytes ownersPrefix = this->getNewPrefix("owners_");
  const Bytes balancesPrefix = this->getNewPrefix("balances_");
  for (const auto& dbEntry : this->db_.getBatch(ownersPrefix)) batch.delete_key(dbEntry.key, ownersPrefix);
  for (const auto& dbEntry : this->db_.getBatch(balancesPrefix)) batch.delete_key(dbEntry.key, balancesPrefix);
  for (const auto& [tokenId, owner] : this->owners_.committed()) {
    batch.push_back(Utils::uint256ToBytes(tokenId), owner.view(), ownersPrefix);
  }
  for (const auto& [owner, balance] : this->balances_.committed()) {
    batch.push_back(owner.view(), Utils::uint256ToBytes(balance), balancesPrefix);
  }
  this->db_.putBatch(batch);
}

uint256_t ERC721::mint_(const Address& to, const uint256_t& quantity) {
  if (to.isZero()) throw DynamicException(ContractErrors::MintToZeroAddress);
  if (quantity == 0) throw DynamicException(ContractErrors::MintZeroQuantity);
  const uint256_t first = this->currentIndex_.get();
  for (uint256_t tokenId = first; tokenId < first + quantity; ++tokenId) {
    this->owners_[tokenId] = to;
  }
  this->balances_[to] += quantity;
  this->currentIndex_ += quantity;
  Logger::logToDebug(LogType::DEBUG, Log::erc721, __func__,
    "Minted " + quantity.str() + " token(s) from id " + first.str() + " to " + to.hex(true).get()
  );
  return first;
}

void ERC721::burn_(const uint256_t& tokenId) {
  const Address owner = this->ownerOf(tokenId);
  this->owners_.erase(tokenId);
  uint256_t& balance = this->balances_[owner];
  balance -= 1;
  if (balance == 0) this->balances_.erase(owner);
  this->burnCounter_ += 1;
  Logger::logToDebug(LogType::DEBUG, Log::erc721, __func__,
    "Burned token " + tokenId.str() + " of " + owner.hex(true).get()
  );
}

uint256_t ERC721::balanceOf(const Address& owner) const {
  if (owner.isZero()) throw DynamicException(ContractErrors::InvalidAddress);
  return this->balances_.get(owner);
}

Address ERC721::ownerOf(const uint256_t& tokenId) const {
  const Address* owner = this->owners_.find(tokenId);
  if (owner == nullptr) throw DynamicException(ContractErrors::AssetNotFound);
  return *owner;
}

std::string ERC721::tokenURI(const uint256_t& tokenId) const {
  if (!this->exists(tokenId)) throw DynamicException(ContractErrors::AssetNotFound);
  const std::string base = this->baseURI_();
  return (base.empty()) ? "" : base + tokenId.str();
}

std::vector<uint256_t> ERC721::tokensOfOwner(const Address& owner) const {
  std::vector<uint256_t> tokens;
  for (uint256_t tokenId = 0; tokenId < this->currentIndex_.get(); ++tokenId) {
    const Address* tokenOwner = this->owners_.find(tokenId);
    if (tokenOwner != nullptr && *tokenOwner == owner) tokens.push_back(tokenId);
  }
  return tokens;
}
