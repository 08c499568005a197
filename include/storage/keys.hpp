#pragma once
#include <string>

namespace StorageKeys {
  // u16 big-endian length || namespace. Throws std::length_error past 0xFFFF bytes.
  std::string LengthPrefixed(const std::string& ns);
  // Key for `key` inside namespace `ns`; distinct namespaces never collide.
  std::string Namespaced(const std::string& ns, const std::string& key);
}
