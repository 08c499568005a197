#include "crypto/keccak.hpp"
#include "utils/hex.hpp"
#include <cryptopp/keccak.h>

namespace Crypto {
  std::string Keccak256(const std::string& raw) {
    CryptoPP::Keccak_256 hash;
    unsigned char digest[CryptoPP::Keccak_256::DIGESTSIZE];
    hash.CalculateDigest(digest, reinterpret_cast<const unsigned char*>(raw.data()), raw.size());
    return std::string(reinterpret_cast<const char*>(digest), sizeof(digest));
  }

  std::string Keccak256Hex(const std::string& raw) {
    return BytesToHex(Keccak256(raw));
  }
}
