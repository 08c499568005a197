#pragma once
#include "storage/storage.hpp"
#include <string>

// Memory store backed by a JSON file of hex-encoded key/value pairs.
// Load() and Flush() throw std::runtime_error on I/O or format errors.
class FileStorage final : public MemoryStorage {
public:
  explicit FileStorage(const std::string& path);
  // Missing file means empty state.
  void Load();
  void Flush() const;
private:
  std::string path_;
};
