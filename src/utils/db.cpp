#include "db.h"
#include "logger.h"
#include "hex.h"

#include <leveldb/iterator.h>

DB::DB(const std::filesystem::path& path) {
  this->opts_.create_if_missing = true;
  if (!std::filesystem::exists(path)) std::filesystem::create_directories(path);
  leveldb::DB* raw = nullptr;
  auto status = leveldb::DB::Open(this->opts_, path.string(), &raw);
  if (!status.ok()) {
    Logger::logToDebug(LogType::ERROR, Log::db, __func__, "Failed to open DB: " + status.ToString());
    throw DynamicException("Failed to open DB at ", path.string(), ": ", status.ToString());
  }
  this->db_.reset(raw);
}

bool DB::has(const BytesArrView key, const Bytes& pfx) const {
  std::string value;
  Bytes k = prefixedKey(key, pfx);
  auto status = this->db_->Get(leveldb::ReadOptions(), toSlice(k), &value);
  return status.ok();
}

Bytes DB::get(const BytesArrView key, const Bytes& pfx) const {
  std::string value;
  Bytes k = prefixedKey(key, pfx);
  auto status = this->db_->Get(leveldb::ReadOptions(), toSlice(k), &value);
  if (status.IsNotFound()) return {};
  if (!status.ok()) {
    Logger::logToDebug(LogType::ERROR, Log::db, __func__,
      "Failed to read key " + Hex::fromBytes(k).get() + ": " + status.ToString()
    );
    return {};
  }
  return Bytes(value.cbegin(), value.cend());
}

bool DB::put(const BytesArrView key, const BytesArrView value, const Bytes& pfx) {
  Bytes k = prefixedKey(key, pfx);
  auto status = this->db_->Put(leveldb::WriteOptions(), toSlice(k), toSlice(value));
  if (!status.ok()) {
    Logger::logToDebug(LogType::ERROR, Log::db, __func__,
      "Failed to put key " + Hex::fromBytes(k).get() + ": " + status.ToString()
    );
    return false;
  }
  return true;
}

bool DB::del(const BytesArrView key, const Bytes& pfx) {
  Bytes k = prefixedKey(key, pfx);
  auto status = this->db_->Delete(leveldb::WriteOptions(), toSlice(k));
  if (!status.ok()) {
    Logger::logToDebug(LogType::ERROR, Log::db, __func__,
      "Failed to delete key " + Hex::fromBytes(k).get() + ": " + status.ToString()
    );
    return false;
  }
  return true;
}

bool DB::putBatch(const DBBatch& batch) {
  std::lock_guard lock(this->batchLock_);
  leveldb::WriteBatch wb;
  // Deletes first, so a batch can clear a collection and rewrite it.
  for (const Bytes& key : batch.getDels()) wb.Delete(toSlice(key));
  for (const DBEntry& entry : batch.getPuts()) wb.Put(toSlice(entry.key), toSlice(entry.value));
  auto status = this->db_->Write(leveldb::WriteOptions(), &wb);
  if (!status.ok()) {
    Logger::logToDebug(LogType::ERROR, Log::db, __func__, "Failed to write batch: " + status.ToString());
    return false;
  }
  return true;
}

std::vector<DBEntry> DB::getBatch(const Bytes& pfx) const {
  std::lock_guard lock(this->batchLock_);
  std::vector<DBEntry> ret;
  std::unique_ptr<leveldb::Iterator> it(this->db_->NewIterator(leveldb::ReadOptions()));
  leveldb::Slice pfxSlice = toSlice(pfx);
  for (it->Seek(pfxSlice); it->Valid() && it->key().starts_with(pfxSlice); it->Next()) {
    leveldb::Slice key = it->key();
    key.remove_prefix(pfx.size());
    ret.emplace_back(
      Bytes(key.data(), key.data() + key.size()),
      Bytes(it->value().data(), it->value().data() + it->value().size())
    );
  }
  return ret;
}
