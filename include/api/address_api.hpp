#pragma once
#include <cstddef>
#include <string>

// External, human-readable address as supplied by callers.
using HumanAddr = std::string;

// Canonical byte form of an identity. Owner/feeder checks compare these only.
struct CanonicalAddr {
  std::string bytes;

  bool operator==(const CanonicalAddr& o) const { return bytes == o.bytes; }
  bool operator!=(const CanonicalAddr& o) const { return bytes != o.bytes; }
};

// Identity resolution supplied by the host. Both directions throw
// ContractError(InvalidInput) on malformed input.
class IAddressApi {
public:
  virtual ~IAddressApi() = default;
  virtual CanonicalAddr CanonicalAddress(const HumanAddr& human) const = 0;
  virtual HumanAddr HumanAddress(const CanonicalAddr& canonical) const = 0;
};

// Plain-string addresses ("owner0000") zero-padded to a fixed canonical length.
class PaddedAddressApi final : public IAddressApi {
public:
  static constexpr size_t kDefaultCanonicalLength = 20;
  static constexpr size_t kMinHumanLength = 3;

  explicit PaddedAddressApi(size_t canonical_length = kDefaultCanonicalLength);
  CanonicalAddr CanonicalAddress(const HumanAddr& human) const override;
  HumanAddr HumanAddress(const CanonicalAddr& canonical) const override;
private:
  size_t canonical_length_;
};

// 20-byte hex addresses. Input is case-insensitive, output carries the
// EIP-55 mixed-case checksum.
class HexAddressApi final : public IAddressApi {
public:
  static constexpr size_t kAddressBytes = 20;

  CanonicalAddr CanonicalAddress(const HumanAddr& human) const override;
  HumanAddr HumanAddress(const CanonicalAddr& canonical) const override;
};
