#include "storage/file_storage.hpp"
#include "common/logger.hpp"
#include "utils/hex.hpp"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

FileStorage::FileStorage(const std::string& path) : path_(path) {}

void FileStorage::Load() {
  data_.clear();
  std::ifstream in(path_);
  if (!in.is_open()) {
    Logger::Info("state file not found, starting empty: " + path_);
    return;
  }
  json j;
  try {
    in >> j;
  } catch (const json::exception& e) {
    throw std::runtime_error("corrupt state file " + path_ + ": " + e.what());
  }
  if (!j.is_object()) throw std::runtime_error("state file " + path_ + " is not a JSON object");
  for (auto it = j.begin(); it != j.end(); ++it) {
    if (!it.value().is_string()) throw std::runtime_error("state file " + path_ + " has non-string value");
    try {
      data_[HexToBytes(it.key())] = HexToBytes(it.value().get<std::string>());
    } catch (const std::invalid_argument& e) {
      throw std::runtime_error("state file " + path_ + " has bad hex entry: " + e.what());
    }
  }
  Logger::Debug("loaded " + std::to_string(data_.size()) + " entries from " + path_);
}

void FileStorage::Flush() const {
  json j = json::object();
  for (const auto& kv : data_) j[BytesToHex(kv.first)] = BytesToHex(kv.second);
  const std::string tmp = path_ + ".tmp";
  {
    std::ofstream out(tmp, std::ios::out | std::ios::trunc);
    if (!out.is_open()) throw std::runtime_error("cannot open " + tmp + " for writing");
    out << j.dump(2) << '\n';
    if (!out) throw std::runtime_error("write failed: " + tmp);
  }
  if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
    throw std::runtime_error("cannot replace state file " + path_);
  }
}
