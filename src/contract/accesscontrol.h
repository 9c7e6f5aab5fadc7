#ifndef ACCESSCONTROL_H
#define ACCESSCONTROL_H

#include <vector>

#include "basecontract.h"
#include "variables/safeunorderedmap.h"
#include "variables/safevalue.h"

/// Capability check used to gate privileged contract functions.
class AccessControl {
  public:
    virtual ~AccessControl() = default;

    /**
     * Whether `caller` may use privileged functions.
     * @param caller The address to check.
     */
    virtual bool isPrivileged(const Address& caller) const = 0;
};

/**
 * Owner plus admin set. The owner is privileged implicitly; admins are
 * privileged while they're in the set.
 */
class AdminRegistry : public AccessControl {
  private:
    SafeAddress owner_; ///< Distinguished owner.
    SafeUnorderedMap<Address, bool> admins_; ///< Admin set (value is always true).

  public:
    /**
     * Constructor.
     * @param contract The contract owning the registry's state.
     * @param owner The initial owner.
     */
    AdminRegistry(BaseContract* contract, const Address& owner);

    bool isPrivileged(const Address& caller) const override;

    bool isOwner(const Address& caller) const { return this->owner_.get() == caller; }

    bool isAdmin(const Address& caller) const { return this->admins_.contains(caller); }

    const Address& owner() const { return this->owner_.get(); }

    /// Committed admins, sorted.
    std::vector<Address> admins() const;

    void addAdmin(const Address& admin);

    void removeAdmin(const Address& admin);

    void setOwner(const Address& owner);

    /// Load the committed state from the DB.
    void load(const DB& db, const BaseContract& contract);

    /// Write the committed state into a batch.
    void dump(const DB& db, DBBatch& batch, const BaseContract& contract) const;

    void commit();

    void enableRegister();
};

#endif // ACCESSCONTROL_H
