#pragma once
#include <map>
#include <optional>
#include <string>

// Read-only view handed to queries.
class IReadonlyStorage {
public:
  virtual ~IReadonlyStorage() = default;
  virtual std::optional<std::string> Get(const std::string& key) const = 0;
};

class IStorage : public IReadonlyStorage {
public:
  virtual void Set(const std::string& key, const std::string& value) = 0;
};

class MemoryStorage : public IStorage {
public:
  std::optional<std::string> Get(const std::string& key) const override;
  void Set(const std::string& key, const std::string& value) override;
  size_t Size() const { return data_.size(); }
  const std::map<std::string, std::string>& Entries() const { return data_; }
protected:
  std::map<std::string, std::string> data_;
};

// Buffers writes on top of a base store. Nothing reaches the base store until
// Commit(); destroying an uncommitted transaction drops its writes.
class StorageTransaction final : public IStorage {
public:
  explicit StorageTransaction(IStorage& base);
  std::optional<std::string> Get(const std::string& key) const override;
  void Set(const std::string& key, const std::string& value) override;
  void Commit();
  void Rollback();
  size_t PendingWrites() const { return pending_.size(); }
private:
  IStorage& base_;
  std::map<std::string, std::string> pending_;
};
