#include "allowlistmint.h"
#include "../contracthost.h"
#include "../errors.h"
#include "../../utils/logger.h"

AllowlistMint::AllowlistMint(
  const std::string& erc721name, const std::string& erc721symbol, const std::string& baseURI,
  const SaleParams& params, const Hash& allowlistRoot, const Address& treasury,
  const std::vector<Address>& admins,
  ContractHost& host, const Address& address, const Address& creator, DB& db
) : ERC721("AllowlistMint", erc721name, erc721symbol, host, address, creator, db),
  config_(this, params), claims_(this), access_(this, creator),
  allowlistRoot_(this, allowlistRoot), treasury_(this, treasury), paused_(this, false),
  tokenBaseURI_(this, baseURI)
{
  for (const Address& admin : admins) this->access_.addAdmin(admin);

  this->commitState();
  this->enableRegisterState();

  Logger::logToDebug(LogType::INFO, Log::allowlistMint, __func__,
    "Deployed " + erc721name + " at " + address.hex(true).get() + " owned by " + creator.hex(true).get()
    + ", max supply " + params.maxSupply.str()
  );
}

AllowlistMint::AllowlistMint(ContractHost& host, const Address& address, DB& db)
  : ERC721(host, address, db), config_(this, SaleParams()), claims_(this), access_(this, Address()),
  allowlistRoot_(this), treasury_(this), paused_(this), tokenBaseURI_(this)
{
  const Bytes& prefix = this->getDBPrefix();
  this->config_.load(this->db_, *this);
  this->claims_.load(this->db_, *this);
  this->access_.load(this->db_, *this);
  this->allowlistRoot_ = Hash(BytesArrView(this->db_.get(std::string("allowlistRoot_"), prefix)));
  this->treasury_ = Address(BytesArrView(this->db_.get(std::string("treasury_"), prefix)));
  this->paused_ = (this->db_.get(std::string("paused_"), prefix) == Bytes{0x01});
  this->tokenBaseURI_ = Utils::bytesToString(this->db_.get(std::string("tokenBaseURI_"), prefix));

  this->commitState();
  this->enableRegisterState();
}

AllowlistMint::~AllowlistMint() {
  DBBatch batch;
  const Bytes& prefix = this->getDBPrefix();
  this->config_.dump(batch, *this);
  this->claims_.dump(batch, *this);
  this->access_.dump(this->db_, batch, *this);
  batch.push_back(Utils::create_view_span(std::string("allowlistRoot_")), this->allowlistRoot_.get().view(), prefix);
  batch.push_back(Utils::create_view_span(std::string("treasury_")), this->treasury_.get().view(), prefix);
  batch.push_back(Utils::create_view_span(std::string("paused_")), Bytes{Byte(this->paused_.get() ? 0x01 : 0x00)}, prefix);
  batch.push_back(Utils::create_view_span(std::string("tokenBaseURI_")), Utils::create_view_span(this->tokenBaseURI_.get()), prefix);
  this->db_.putBatch(batch);
}

void AllowlistMint::commitState() {
  this->config_.commit();
  this->claims_.commit();
  this->access_.commit();
  this->allowlistRoot_.commit();
  this->treasury_.commit();
  this->paused_.commit();
  this->tokenBaseURI_.commit();
}

void AllowlistMint::enableRegisterState() {
  this->config_.enableRegister();
  this->claims_.enableRegister();
  this->access_.enableRegister();
  this->allowlistRoot_.enableRegister();
  this->treasury_.enableRegister();
  this->paused_.enableRegister();
  this->tokenBaseURI_.enableRegister();
}

void AllowlistMint::onlyPrivileged() const {
  if (!this->access_.isPrivileged(this->getCaller())) throw DynamicException(ContractErrors::Unauthorized);
}

void AllowlistMint::whenNotPaused() const {
  if (this->paused_.get()) throw DynamicException(ContractErrors::Paused);
}

void AllowlistMint::mintFor(SaleClass kind, const uint256_t& quantity, const std::vector<Hash>& proof) {
  ReentrancyGuard reentrancyGuard(this->reentrancyLock_);
  this->whenNotPaused();
  const Address caller = this->getCaller();
  const uint256_t payment = this->getValue();

  if (!this->config_.isPhaseActive(kind)) throw DynamicException(ContractErrors::PhaseInactive);
  if (kind == SaleClass::Whitelist && !MerkleProof::verify(proof, this->allowlistRoot_.get(), caller)) {
    throw DynamicException(ContractErrors::NotEligible);
  }
  // Compare by subtraction, claimed + quantity could leave uint256_t's range.
  const uint256_t& cap = this->config_.perAddressCap(kind);
  const uint256_t claimed = this->claims_.claimed(caller, kind);
  if (claimed > cap || quantity > cap - claimed) throw DynamicException(ContractErrors::PerAddressCapExceeded);
  // Divide instead of multiplying, quantity * price may not fit in uint256_t.
  const uint256_t& price = this->config_.unitPrice(kind);
  if (quantity != 0 && payment / quantity < price) throw DynamicException(ContractErrors::InsufficientPayment);
  const uint256_t issued = this->totalSupply();
  const uint256_t& maxSupply = this->config_.maxSupply();
  if (issued > maxSupply || quantity > maxSupply - issued) throw DynamicException(ContractErrors::SupplyExceeded);

  // The whole attached value goes to the treasury, overpayment included.
  this->sendTokens(this->treasury_.get(), payment);
  this->claims_.record(caller, kind, quantity);
  const uint256_t firstId = this->mint_(caller, quantity);

  Logger::logToDebug(LogType::INFO, Log::allowlistMint, __func__,
    saleClassToString(kind) + " mint of " + quantity.str() + " token(s) from id " + firstId.str()
    + " by " + caller.hex(true).get() + ", paid " + payment.str()
  );
}

void AllowlistMint::whitelistMint(const uint256_t& quantity, const std::vector<Hash>& proof) {
  this->mintFor(SaleClass::Whitelist, quantity, proof);
}

void AllowlistMint::publicMint(const uint256_t& quantity) {
  this->mintFor(SaleClass::Public, quantity, {});
}

bool AllowlistMint::isEligible(const std::vector<Hash>& proof, const Address& account) const {
  return MerkleProof::verify(proof, this->allowlistRoot_.get(), account);
}

void AllowlistMint::setAllowlistRoot(const Hash& root) {
  this->onlyPrivileged();
  this->allowlistRoot_ = root;
  Logger::logToDebug(LogType::INFO, Log::allowlistMint, __func__, "Allowlist root set to " + root.hex(true).get());
}

void AllowlistMint::setTreasury(const Address& treasury) {
  this->onlyPrivileged();
  if (treasury.isZero()) throw DynamicException(ContractErrors::InvalidAddress);
  this->treasury_ = treasury;
  Logger::logToDebug(LogType::INFO, Log::allowlistMint, __func__, "Treasury set to " + treasury.hex(true).get());
}

void AllowlistMint::setUnitPrice(SaleClass kind, const uint256_t& amount) {
  this->onlyPrivileged();
  this->config_.setUnitPrice(kind, amount);
}

void AllowlistMint::setMaxSupply(const uint256_t& maxSupply) {
  this->onlyPrivileged();
  this->config_.setMaxSupply(maxSupply);
}

void AllowlistMint::setPerAddressCap(SaleClass kind, const uint256_t& cap) {
  this->onlyPrivileged();
  this->config_.setPerAddressCap(kind, cap);
}

void AllowlistMint::setPhase(bool presale, bool publicSale) {
  this->onlyPrivileged();
  this->config_.setPhase(presale, publicSale);
}

void AllowlistMint::setPreSale(bool active) {
  this->onlyPrivileged();
  this->config_.setPresale(active);
}

void AllowlistMint::switchToPublicPhase() {
  this->onlyPrivileged();
  this->config_.switchToPublicPhase();
  Logger::logToDebug(LogType::INFO, Log::allowlistMint, __func__, "Presale closed, public sale open");
}

void AllowlistMint::addAdmins(const std::vector<Address>& admins) {
  this->onlyPrivileged();
  for (const Address& admin : admins) this->access_.addAdmin(admin);
}

void AllowlistMint::removeAdmins(const std::vector<Address>& admins) {
  this->onlyPrivileged();
  for (const Address& admin : admins) this->access_.removeAdmin(admin);
}

void AllowlistMint::pause() {
  this->onlyPrivileged();
  this->paused_ = true;
}

void AllowlistMint::unpause() {
  this->onlyPrivileged();
  this->paused_ = false;
}

void AllowlistMint::setBaseURI(const std::string& baseURI) {
  this->onlyPrivileged();
  this->tokenBaseURI_ = baseURI;
}

void AllowlistMint::burn(const uint256_t& tokenId) {
  this->onlyPrivileged();
  if (this->ownerOf(tokenId) != this->getCaller()) throw DynamicException(ContractErrors::NotAssetOwner);
  this->burn_(tokenId);
}

void AllowlistMint::transferOwnership(const Address& newOwner) {
  if (!this->access_.isOwner(this->getCaller())) throw DynamicException(ContractErrors::Unauthorized);
  if (newOwner.isZero()) throw DynamicException(ContractErrors::InvalidAddress);
  this->access_.setOwner(newOwner);
}
