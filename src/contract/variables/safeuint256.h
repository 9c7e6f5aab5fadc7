#ifndef SAFEUINT256_H
#define SAFEUINT256_H

#include <memory>
#include <vector>

#include "safebase.h"
#include "../../utils/utils.h"

/**
 * Safe wrapper for a uint256_t.
 * Arithmetic is checked by uint256_t itself, so an overflowing += throws
 * std::overflow_error before the pending value is touched.
 */
class SafeUint256_t : public SafeBase {
  private:
    uint256_t value_; ///< Committed value.
    std::unique_ptr<uint256_t> tmp_; ///< Pending value of the current transaction.
    std::vector<std::unique_ptr<uint256_t>> checkpoints_; ///< Pending values saved at call entry.

    void saveCheckpoint() override {
      this->checkpoints_.push_back((this->tmp_) ? std::make_unique<uint256_t>(*this->tmp_) : nullptr);
    }

    void restoreCheckpoint() override {
      this->tmp_ = std::move(this->checkpoints_.back());
      this->checkpoints_.pop_back();
    }

    void dropCheckpoint() override { this->checkpoints_.pop_back(); }

  public:
    SafeUint256_t(BaseContract* owner, const uint256_t& value = 0)
      : SafeBase(owner), value_(0), tmp_(std::make_unique<uint256_t>(value)) {}

    SafeUint256_t() : SafeBase(nullptr), value_(0), tmp_(std::make_unique<uint256_t>(0)) {}

    inline const uint256_t& get() const { return (this->tmp_) ? *this->tmp_ : this->value_; }

    inline SafeUint256_t& operator=(const uint256_t& other) {
      this->markAsUsed();
      this->tmp_ = std::make_unique<uint256_t>(other);
      return *this;
    }

    inline SafeUint256_t& operator+=(const uint256_t& other) {
      uint256_t result = this->get() + other;
      return (*this = result);
    }

    inline SafeUint256_t& operator-=(const uint256_t& other) {
      uint256_t result = this->get() - other;
      return (*this = result);
    }

    inline bool operator==(const uint256_t& other) const { return this->get() == other; }
    inline bool operator<(const uint256_t& other) const { return this->get() < other; }
    inline bool operator<=(const uint256_t& other) const { return this->get() <= other; }
    inline bool operator>(const uint256_t& other) const { return this->get() > other; }
    inline bool operator>=(const uint256_t& other) const { return this->get() >= other; }

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

#endif // SAFEUINT256_H
