#ifndef SAFEBASE_H
#define SAFEBASE_H

#include <cstddef>
#include <vector>

class BaseContract; // Forward declaration.
class SafeBase;

// Defined in basecontract.cpp, avoids a circular include.
void registerVariableUse(BaseContract& contract, SafeBase& variable);

/**
 * Base class for all safe variables.
 * A safe variable keeps its committed value apart from the value being written
 * by the current transaction. On its first write inside a call, the variable
 * saves a checkpoint of its pending state for that call's depth, so a failed
 * call (nested or not) can roll back exactly what it wrote.
 */
class SafeBase {
  private:
    BaseContract* owner_ = nullptr; ///< Contract the variable belongs to, if any.
    std::vector<std::size_t> checkpointDepths_; ///< Call depths holding a checkpoint, innermost last.
    bool shouldRegister_ = false; ///< Whether writes are tracked yet (off while loading from DB).

  protected:
    /// Getter for the owner.
    inline BaseContract* getOwner() const { return this->owner_; }

    /// Register the variable as written by the current call. Called by every write.
    void markAsUsed() {
      if (this->owner_ != nullptr && this->shouldRegister_) registerVariableUse(*this->owner_, *this);
    }

    /// Push a copy of the pending state.
    virtual void saveCheckpoint() = 0;

    /// Pop the last saved copy back into the pending state.
    virtual void restoreCheckpoint() = 0;

    /// Pop the last saved copy, keeping the pending state.
    virtual void dropCheckpoint() = 0;

    /// Forget every checkpoint. Called by commit() and revert().
    inline void clearCheckpoints() { this->checkpointDepths_.clear(); }

  public:
    /// Constructor for variables not bound to a contract (not tracked).
    SafeBase() = default;

    /**
     * Constructor for variables bound to a contract.
     * @param owner The contract owning the variable.
     */
    explicit SafeBase(BaseContract* owner) : owner_(owner) {}

    SafeBase(const SafeBase&) = delete;
    SafeBase& operator=(const SafeBase&) = delete;

    virtual ~SafeBase() = default;

    /// Start tracking writes. Called by the contract constructor once loading is done.
    inline void enableRegister() { this->shouldRegister_ = true; }

    /// Depth of the innermost call holding a checkpoint of this variable, 0 if none.
    inline std::size_t checkpointDepth() const {
      return (this->checkpointDepths_.empty()) ? 0 : this->checkpointDepths_.back();
    }

    /// Save the pending state on behalf of the call at `depth`.
    void checkpoint(std::size_t depth) {
      this->saveCheckpoint();
      this->checkpointDepths_.push_back(depth);
    }

    /// Undo everything written since the innermost checkpoint.
    void rollback() {
      this->restoreCheckpoint();
      this->checkpointDepths_.pop_back();
    }

    /**
     * Hand the innermost checkpoint over to the call at `outerDepth`.
     * If that call already holds its own (older) checkpoint, the inner one is
     * dropped instead.
     * @return `true` if the outer call must now track this variable.
     */
    bool mergeCheckpoint(std::size_t outerDepth) {
      const std::size_t count = this->checkpointDepths_.size();
      if (count >= 2 && this->checkpointDepths_[count - 2] == outerDepth) {
        this->dropCheckpoint();
        this->checkpointDepths_.pop_back();
        return false;
      }
      this->checkpointDepths_.back() = outerDepth;
      return true;
    }

    /// Make the pending value permanent.
    virtual void commit() = 0;

    /// Discard the pending value.
    virtual void revert() = 0;
};

#endif // SAFEBASE_H
