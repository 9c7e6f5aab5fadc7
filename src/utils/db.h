#ifndef DB_H
#define DB_H

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <leveldb/db.h>
#include <leveldb/write_batch.h>

#include "utils.h"

/// Namespace for the top-level key prefixes.
namespace DBPrefix {
  const Bytes contracts = { 0x00, 0x01 }; ///< "contracts" = "0001"
  const Bytes contractManager = { 0x00, 0x02 }; ///< "contractManager" = "0002"
  const Bytes nativeAccounts = { 0x00, 0x03 }; ///< "nativeAccounts" = "0003"
};

/// A key/value pair read from the database.
struct DBEntry {
  Bytes key;
  Bytes value;

  DBEntry(const Bytes& key, const Bytes& value) : key(key), value(value) {};
};

/// A batch of puts and deletes, applied atomically by DB::putBatch.
class DBBatch {
  private:
    std::vector<DBEntry> puts_;
    std::vector<Bytes> dels_;

  public:
    DBBatch() = default;

    /**
     * Add a put entry to the batch.
     * @param key The entry's key, without prefix.
     * @param value The entry's value.
     * @param prefix The prefix prepended to the key.
     */
    void push_back(const BytesArrView key, const BytesArrView value, const Bytes& prefix) {
      Bytes tmp = prefix;
      tmp.reserve(prefix.size() + key.size());
      tmp.insert(tmp.end(), key.begin(), key.end());
      this->puts_.emplace_back(std::move(tmp), Bytes(value.begin(), value.end()));
    }

    /**
     * Add a delete entry to the batch.
     * @param key The key to delete, without prefix.
     * @param prefix The prefix prepended to the key.
     */
    void delete_key(const BytesArrView key, const Bytes& prefix) {
      Bytes tmp = prefix;
      tmp.insert(tmp.end(), key.begin(), key.end());
      this->dels_.emplace_back(std::move(tmp));
    }

    inline const std::vector<DBEntry>& getPuts() const { return this->puts_; }
    inline const std::vector<Bytes>& getDels() const { return this->dels_; }
};

/// Thin wrapper over a LevelDB database with prefixed keys.
class DB {
  private:
    std::unique_ptr<leveldb::DB> db_;
    leveldb::Options opts_;
    mutable std::mutex batchLock_;

    static leveldb::Slice toSlice(const BytesArrView b) {
      return leveldb::Slice(reinterpret_cast<const char*>(b.data()), b.size());
    }

    static Bytes prefixedKey(const BytesArrView key, const Bytes& pfx) {
      Bytes ret = pfx;
      ret.insert(ret.end(), key.begin(), key.end());
      return ret;
    }

  public:
    /**
     * Open (creating if needed) the database at the given path.
     * @throw DynamicException if the database can't be opened.
     */
    explicit DB(const std::filesystem::path& path);

    DB(const DB&) = delete;
    DB& operator=(const DB&) = delete;

    /// Check if a key exists.
    bool has(const BytesArrView key, const Bytes& pfx = {}) const;

    /// Get a value, empty if the key doesn't exist.
    Bytes get(const BytesArrView key, const Bytes& pfx = {}) const;

    /// Put a single value. Returns false on write failure.
    bool put(const BytesArrView key, const BytesArrView value, const Bytes& pfx = {});

    /// Delete a single key. Returns false on write failure.
    bool del(const BytesArrView key, const Bytes& pfx = {});

    /// Apply a batch atomically. Returns false on write failure.
    bool putBatch(const DBBatch& batch);

    /**
     * Get every entry under a prefix. Returned keys have the prefix stripped.
     * @param pfx The prefix to scan.
     */
    std::vector<DBEntry> getBatch(const Bytes& pfx) const;

    /// Convenience overloads for string keys.
    Bytes get(const std::string& key, const Bytes& pfx = {}) const { return this->get(Utils::create_view_span(key), pfx); }
    bool put(const std::string& key, const BytesArrView value, const Bytes& pfx = {}) {
      return this->put(Utils::create_view_span(key), value, pfx);
    }
    bool has(const std::string& key, const Bytes& pfx = {}) const { return this->has(Utils::create_view_span(key), pfx); }
};

#endif // DB_H
