#include "accesscontrol.h"
#include "../utils/logger.h"

#include <algorithm>

AdminRegistry::AdminRegistry(BaseContract* contract, const Address& owner)
  : owner_(contract, owner), admins_(contract)
{}

bool AdminRegistry::isPrivileged(const Address& caller) const {
  return this->isOwner(caller) || this->isAdmin(caller);
}

std::vector<Address> AdminRegistry::admins() const {
  std::vector<Address> ret;
  ret.reserve(this->admins_.committed().size());
  for (const auto& [admin, enabled] : this->admins_.committed()) ret.push_back(admin);
  std::sort(ret.begin(), ret.end());
  return ret;
}

void AdminRegistry::addAdmin(const Address& admin) {
  this->admins_[admin] = true;
  Logger::logToDebug(LogType::INFO, Log::accessControl, __func__, "Admin added: " + admin.hex(true).get());
}

void AdminRegistry::removeAdmin(const Address& admin) {
  if (!this->admins_.contains(admin)) return;
  this->admins_.erase(admin);
  Logger::logToDebug(LogType::INFO, Log::accessControl, __func__, "Admin removed: " + admin.hex(true).get());
}

void AdminRegistry::setOwner(const Address& owner) {
  Logger::logToDebug(LogType::INFO, Log::accessControl, __func__,
    "Ownership moved from " + this->owner_.get().hex(true).get() + " to " + owner.hex(true).get()
  );
  this->owner_ = owner;
}

void AdminRegistry::load(const DB& db, const BaseContract& contract) {
  this->owner_ = Address(BytesArrView(db.get(std::string("owner_"), contract.getDBPrefix())));
  for (const auto& dbEntry : db.getBatch(contract.getNewPrefix("admins_"))) {
    this->admins_[Address(BytesArrView(dbEntry.key))] = true;
  }
}

void AdminRegistry::dump(const DB& db, DBBatch& batch, const BaseContract& contract) const {
  const Bytes adminsPrefix = contract.getNewPrefix("admins_");
  batch.push_back(Utils::create_view_span(std::string("owner_")), this->owner_.get().view(), contract.getDBPrefix());
  // Clear the stored set first, removed admins must not come back on reload.
  for (const auto& dbEntry : db.getBatch(adminsPrefix)) batch.delete_key(dbEntry.key, adminsPrefix);
  for (const auto& [admin, enabled] : this->admins_.committed()) {
    batch.push_back(admin.view(), Bytes{0x01}, adminsPrefix);
  }
}

void AdminRegistry::commit() {
  this->owner_.commit();
  this->admins_.commit();
}

void AdminRegistry::enableRegister() {
  this->owner_.enableRegister();
  this->admins_.enableRegister();
}
