#ifndef SAFEUNORDEREDMAP_H
#define SAFEUNORDEREDMAP_H

#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

#include "safebase.h"
#include "../../utils/safehash.h"

/**
 * Safe wrapper for an unordered_map.
 * Entries written by the current call live in a pending overlay; an overlay
 * entry holding std::nullopt marks a pending erase.
 */
template <typename Key, typename T, typename Hasher = SafeHash> class SafeUnorderedMap : public SafeBase {
  private:
    using Overlay = std::unordered_map<Key, std::optional<T>, Hasher>;

    std::unordered_map<Key, T, Hasher> map_; ///< Committed entries.
    std::unique_ptr<Overlay> tmp_; ///< Pending overlay.
    std::vector<std::unique_ptr<Overlay>> checkpoints_; ///< Overlays saved at call entry.

    inline void check() {
      if (!this->tmp_) this->tmp_ = std::make_unique<Overlay>();
    }

    void saveCheckpoint() override {
      this->checkpoints_.push_back((this->tmp_) ? std::make_unique<Overlay>(*this->tmp_) : nullptr);
    }

    void restoreCheckpoint() override {
      this->tmp_ = std::move(this->checkpoints_.back());
      this->checkpoints_.pop_back();
    }

    void dropCheckpoint() override { this->checkpoints_.pop_back(); }

  public:
    explicit SafeUnorderedMap(BaseContract* owner) : SafeBase(owner) {}

    SafeUnorderedMap() : SafeBase(nullptr) {}

    /// Look up a key, returning nullptr if absent (or pending erase).
    const T* find(const Key& key) const {
      if (this->tmp_) {
        auto it = this->tmp_->find(key);
        if (it != this->tmp_->end()) return (it->second) ? &*it->second : nullptr;
      }
      auto it = this->map_.find(key);
      return (it != this->map_.end()) ? &it->second : nullptr;
    }

    inline bool contains(const Key& key) const { return this->find(key) != nullptr; }

    /// Value for a key, or a default-constructed T if absent.
    T get(const Key& key) const {
      const T* value = this->find(key);
      return (value != nullptr) ? *value : T();
    }

    /**
     * Mutable access to a key, inserting a default T if absent.
     * The entry is copied into the pending overlay before being handed out.
     */
    T& operator[](const Key& key) {
      this->markAsUsed();
      this->check();
      auto it = this->tmp_->find(key);
      if (it == this->tmp_->end()) {
        auto committed = this->map_.find(key);
        it = this->tmp_->emplace(key, (committed != this->map_.end()) ? committed->second : T()).first;
      } else if (!it->second) {
        it->second = T();
      }
      return *it->second;
    }

    /// Erase a key (pending until commit).
    void erase(const Key& key) {
      this->markAsUsed();
      this->check();
      (*this->tmp_)[key] = std::nullopt;
    }

    /// Committed entries only. Used when dumping to the DB.
    inline const std::unordered_map<Key, T, Hasher>& committed() const { return this->map_; }

    void commit() override {
      if (this->tmp_) {
        for (auto& [key, value] : *this->tmp_) {
          if (value) {
            this->map_.insert_or_assign(key, std::move(*value));
          } else {
            this->map_.erase(key);
          }
        }
      }
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

#endif // SAFEUNORDEREDMAP_H
