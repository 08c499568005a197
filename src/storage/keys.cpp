#include "storage/keys.hpp"
#include <stdexcept>

namespace StorageKeys {
  std::string LengthPrefixed(const std::string& ns) {
    if (ns.size() > 0xFFFF) throw std::length_error("storage namespace longer than 65535 bytes");
    std::string out;
    out.reserve(ns.size() + 2);
    out.push_back(static_cast<char>((ns.size() >> 8) & 0xFF));
    out.push_back(static_cast<char>(ns.size() & 0xFF));
    out += ns;
    return out;
  }

  std::string Namespaced(const std::string& ns, const std::string& key) {
    return LengthPrefixed(ns) + key;
  }
}
