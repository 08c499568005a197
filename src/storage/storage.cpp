#include "storage/storage.hpp"

std::optional<std::string> MemoryStorage::Get(const std::string& key) const {
  auto it = data_.find(key);
  if (it == data_.end()) return std::nullopt;
  return it->second;
}

void MemoryStorage::Set(const std::string& key, const std::string& value) {
  data_[key] = value;
}

StorageTransaction::StorageTransaction(IStorage& base) : base_(base) {}

std::optional<std::string> StorageTransaction::Get(const std::string& key) const {
  auto it = pending_.find(key);
  if (it != pending_.end()) return it->second;
  return base_.Get(key);
}

void StorageTransaction::Set(const std::string& key, const std::string& value) {
  pending_[key] = value;
}

void StorageTransaction::Commit() {
  for (const auto& kv : pending_) base_.Set(kv.first, kv.second);
  pending_.clear();
}

void StorageTransaction::Rollback() { pending_.clear(); }
