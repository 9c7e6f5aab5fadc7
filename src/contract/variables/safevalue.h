#ifndef SAFEVALUE_H
#define SAFEVALUE_H

#include <memory>
#include <string>
#include <vector>

#include "safebase.h"
#include "../../utils/strings.h"

/**
 * Safe wrapper for a plain value (bool, Address, Hash, std::string, ...).
 * Writes go to a temporary copy until commit() makes them permanent.
 */
template <typename T> class SafeValue : public SafeBase {
  private:
    T value_; ///< Committed value.
    std::unique_ptr<T> tmp_; ///< Pending value of the current transaction.
    std::vector<std::unique_ptr<T>> checkpoints_; ///< Pending values saved at call entry.

    void saveCheckpoint() override {
      this->checkpoints_.push_back((this->tmp_) ? std::make_unique<T>(*this->tmp_) : nullptr);
    }

    void restoreCheckpoint() override {
      this->tmp_ = std::move(this->checkpoints_.back());
      this->checkpoints_.pop_back();
    }

    void dropCheckpoint() override { this->checkpoints_.pop_back(); }

  public:
    /**
     * Constructor.
     * @param owner The contract owning the variable.
     * @param value The initial value (pending until the first commit).
     */
    SafeValue(BaseContract* owner, const T& value = T()) : SafeBase(owner), value_(), tmp_(std::make_unique<T>(value)) {}

    /// Constructor for unbound variables.
    SafeValue() : SafeBase(nullptr), value_(), tmp_(std::make_unique<T>()) {}

    /// Current value, pending if any.
    inline const T& get() const { return (this->tmp_) ? *this->tmp_ : this->value_; }

    /// Set a new pending value.
    inline void set(const T& value) {
      this->markAsUsed();
      this->tmp_ = std::make_unique<T>(value);
    }

    inline SafeValue& operator=(const T& value) { this->set(value); return *this; }

    inline bool operator==(const T& other) const { return this->get() == other; }

    void commit() override {
      if (this->tmp_) this->value_ = *this->tmp_;
      this->tmp_.reset();
      this->checkpoints_.clear();
      this->clearCheckpoints();
    }

    void revert() override {
      this->tmp_.reset();
      this->checkpoints_.clear();
      this->clearCheckpoints();
    }
};

using SafeBool = SafeValue<bool>;
using SafeAddress = SafeValue<Address>;
using SafeHashValue = SafeValue<Hash>;
using SafeString = SafeValue<std::string>;

#endif // SAFEVALUE_H
