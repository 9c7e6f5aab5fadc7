#include "saleconfig.h"
#include "../utils/logger.h"

namespace {
  Bytes boolToBytes(bool b) { return Bytes{Byte(b ? 0x01 : 0x00)}; }

  bool bytesToBool(const Bytes& b) {
    if (b.size() != 1) throw DynamicException("Invalid bool size - expected 1, got ", b.size());
    return b[0] != 0x00;
  }
}

std::string saleClassToString(SaleClass kind) {
  return (kind == SaleClass::Whitelist) ? "whitelist" : "public";
}

SaleConfig::SaleConfig(BaseContract* contract, const SaleParams& params)
  : presaleActive_(contract, params.presaleActive),
  publicSaleActive_(contract, params.publicSaleActive),
  whitelistUnitPrice_(contract, params.whitelistUnitPrice),
  publicUnitPrice_(contract, params.publicUnitPrice),
  maxSupply_(contract, params.maxSupply),
  maxWhitelistMintPerAddress_(contract, params.maxWhitelistMintPerAddress),
  maxPublicMintPerAddress_(contract, params.maxPublicMintPerAddress)
{}

bool SaleConfig::isPhaseActive(SaleClass kind) const {
  return (kind == SaleClass::Whitelist) ? this->presaleActive() : this->publicSaleActive();
}

const uint256_t& SaleConfig::unitPrice(SaleClass kind) const {
  return (kind == SaleClass::Whitelist) ? this->whitelistUnitPrice_.get() : this->publicUnitPrice_.get();
}

const uint256_t& SaleConfig::perAddressCap(SaleClass kind) const {
  return (kind == SaleClass::Whitelist)
    ? this->maxWhitelistMintPerAddress_.get() : this->maxPublicMintPerAddress_.get();
}

SaleParams SaleConfig::params() const {
  SaleParams ret;
  ret.presaleActive = this->presaleActive_.get();
  ret.publicSaleActive = this->publicSaleActive_.get();
  ret.whitelistUnitPrice = this->whitelistUnitPrice_.get();
  ret.publicUnitPrice = this->publicUnitPrice_.get();
  ret.maxSupply = this->maxSupply_.get();
  ret.maxWhitelistMintPerAddress = this->maxWhitelistMintPerAddress_.get();
  ret.maxPublicMintPerAddress = this->maxPublicMintPerAddress_.get();
  return ret;
}

void SaleConfig::setPresale(bool active) { this->presaleActive_ = active; }

void SaleConfig::setPublicSale(bool active) { this->publicSaleActive_ = active; }

void SaleConfig::setPhase(bool presale, bool publicSale) {
  this->presaleActive_ = presale;
  this->publicSaleActive_ = publicSale;
}

void SaleConfig::switchToPublicPhase() {
  this->presaleActive_ = false;
  this->publicSaleActive_ = true;
}

void SaleConfig::setUnitPrice(SaleClass kind, const uint256_t& amount) {
  if (kind == SaleClass::Whitelist) {
    this->whitelistUnitPrice_ = amount;
  } else {
    this->publicUnitPrice_ = amount;
  }
}

void SaleConfig::setMaxSupply(const uint256_t& maxSupply) { this->maxSupply_ = maxSupply; }

void SaleConfig::setPerAddressCap(SaleClass kind, const uint256_t& cap) {
  if (kind == SaleClass::Whitelist) {
    this->maxWhitelistMintPerAddress_ = cap;
  } else {
    this->maxPublicMintPerAddress_ = cap;
  }
}

void SaleConfig::load(const DB& db, const BaseContract& contract) {
  const Bytes& prefix = contract.getDBPrefix();
  this->presaleActive_ = bytesToBool(db.get(std::string("presaleActive_"), prefix));
  this->publicSaleActive_ = bytesToBool(db.get(std::string("publicSaleActive_"), prefix));
  this->whitelistUnitPrice_ = Utils::bytesToUint256(db.get(std::string("whitelistUnitPrice_"), prefix));
  this->publicUnitPrice_ = Utils::bytesToUint256(db.get(std::string("publicUnitPrice_"), prefix));
  this->maxSupply_ = Utils::bytesToUint256(db.get(std::string("maxSupply_"), prefix));
  this->maxWhitelistMintPerAddress_ = Utils::bytesToUint256(db.get(std::string("maxWhitelistMintPerAddress_"), prefix));
  this->maxPublicMintPerAddress_ = Utils::bytesToUint256(db.get(std::string("maxPublicMintPerAddress_"), prefix));
}

void SaleConfig::dump(DBBatch& batch, const BaseContract& contract) const {
  const Bytes& prefix = contract.getDBPrefix();
  auto put = [&](const std::string& key, const BytesArrView value) {
    batch.push_back(Utils::create_view_span(key), value, prefix);
  };
  put("presaleActive_", boolToBytes(this->presaleActive_.get()));
  put("publicSaleActive_", boolToBytes(this->publicSaleActive_.get()));
  put("whitelistUnitPrice_", Utils::uint256ToBytes(this->whitelistUnitPrice_.get()));
  put("publicUnitPrice_", Utils::uint256ToBytes(this->publicUnitPrice_.get()));
  put("maxSupply_", Utils::uint256ToBytes(this->maxSupply_.get()));
  put("maxWhitelistMintPerAddress_", Utils::uint256ToBytes(this->maxWhitelistMintPerAddress_.get()));
  put("maxPublicMintPerAddress_", Utils::uint256ToBytes(this->maxPublicMintPerAddress_.get()));
}

void SaleConfig::commit() {
  this->presaleActive_.commit();
  this->publicSaleActive_.commit();
  this->whitelistUnitPrice_.commit();
  this->publicUnitPrice_.commit();
  this->maxSupply_.commit();
  this->maxWhitelistMintPerAddress_.commit();
  this->maxPublicMintPerAddress_.commit();
}

void SaleConfig::enableRegister() {
  this->presaleActive_.enableRegister();
  this->publicSaleActive_.enableRegister();
  this->whitelistUnitPrice_.enableRegister();
  this->publicUnitPrice_.enableRegister();
  this->maxSupply_.enableRegister();
  this->maxWhitelistMintPerAddress_.enableRegister();
  this->maxPublicMintPerAddress_.enableRegister();
}
