#include "api/address_api.hpp"
#include "common/errors.hpp"
#include "crypto/keccak.hpp"
#include "utils/hex.hpp"
#include "utils/utf8.hpp"
#include <cctype>

PaddedAddressApi::PaddedAddressApi(size_t canonical_length) : canonical_length_(canonical_length) {}

CanonicalAddr PaddedAddressApi::CanonicalAddress(const HumanAddr& human) const {
  if (human.size() < kMinHumanLength) throw ContractError::InvalidInput("human address too short");
  if (human.size() > canonical_length_) throw ContractError::InvalidInput("human address too long");
  if (human.find('\0') != std::string::npos) throw ContractError::InvalidInput("human address contains NUL byte");
  if (!IsValidUtf8(human)) throw ContractError::InvalidInput("human address is not valid UTF-8");
  CanonicalAddr out{human};
  out.bytes.resize(canonical_length_, '\0');
  return out;
}

HumanAddr PaddedAddressApi::HumanAddress(const CanonicalAddr& canonical) const {
  if (canonical.bytes.size() != canonical_length_) {
    throw ContractError::InvalidInput("wrong canonical address length");
  }
  auto end = canonical.bytes.find_last_not_of('\0');
  if (end == std::string::npos) return HumanAddr();
  return canonical.bytes.substr(0, end + 1);
}

CanonicalAddr HexAddressApi::CanonicalAddress(const HumanAddr& human) const {
  const std::string digits = Strip0x(human);
  if (digits.size() != kAddressBytes * 2 || !IsHexDigits(digits)) {
    throw ContractError::InvalidInput("expected 40 hex digits, got '" + human + "'");
  }
  return CanonicalAddr{HexToBytes(digits)};
}

HumanAddr HexAddressApi::HumanAddress(const CanonicalAddr& canonical) const {
  if (canonical.bytes.size() != kAddressBytes) {
    throw ContractError::InvalidInput("wrong canonical address length");
  }
  std::string lower = BytesToHex(canonical.bytes);
  // EIP-55: uppercase a letter when the matching nibble of keccak(lower) is >= 8
  const std::string hash = Crypto::Keccak256Hex(lower);
  for (size_t i = 0; i < lower.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(lower[i]);
    if (std::isalpha(c) && std::stoi(hash.substr(i, 1), nullptr, 16) >= 8) {
      lower[i] = static_cast<char>(std::toupper(c));
    }
  }
  return "0x" + lower;
}
