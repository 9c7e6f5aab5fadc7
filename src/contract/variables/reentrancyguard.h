#ifndef REENTRANCY_GUARD_H
#define REENTRANCY_GUARD_H

#include "../errors.h"
#include "../../utils/dynamicexception.h"

/**
 * RAII reentrancy guard.
 * Takes the lock on construction and releases it on destruction, so every
 * exit path (return or throw) frees it.
 * @throw DynamicException "ReentrantCall" if the lock is already held.
 */
class ReentrancyGuard {
  private:
    bool& lock_; ///< Reference to the contract's lock flag.

  public:
    explicit ReentrancyGuard(bool& lock) : lock_(lock) {
      if (lock_) throw DynamicException(ContractErrors::ReentrantCall);
      lock_ = true;
    }

    ~ReentrancyGuard() { lock_ = false; }

    ReentrancyGuard(const ReentrancyGuard&) = delete;
    ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;
};

#endif // REENTRANCY_GUARD_H
