#pragma once
#include <string>

namespace Crypto {
  // Returns the 32-byte keccak256 digest of raw input bytes
  std::string Keccak256(const std::string& raw);
  // Returns lowercase hex (no prefix) keccak256 of raw input bytes
  std::string Keccak256Hex(const std::string& raw);
}
