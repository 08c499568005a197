#pragma once
#include <cstdint>
#include <string>

using Uint128 = unsigned __int128;

// Non-negative fixed-point decimal with 18 fractional digits, stored as an
// integer count of 10^-18 units.
class Decimal {
public:
  static constexpr unsigned kFractionalDigits = 18;
  static constexpr uint64_t kFractionalScale = 1000000000000000000ULL;

  Decimal() = default;

  static Decimal Zero() { return Decimal(); }
  static Decimal One() { return FromAtomics(kFractionalScale); }
  static Decimal FromAtomics(Uint128 atomics);
  // Whole-unit value, e.g. FromInteger(3) == "3".
  static Decimal FromInteger(uint64_t whole);
  // Parses "1", "1.2", "0.000000000000000001". Throws ContractError(InvalidInput).
  static Decimal FromString(const std::string& text);

  Uint128 Atomics() const { return atomics_; }
  bool IsZero() const { return atomics_ == 0; }
  std::string ToString() const;

  bool operator==(const Decimal& o) const { return atomics_ == o.atomics_; }
  bool operator!=(const Decimal& o) const { return atomics_ != o.atomics_; }
  bool operator<(const Decimal& o) const { return atomics_ < o.atomics_; }
private:
  explicit Decimal(Uint128 atomics) : atomics_(atomics) {}
  Uint128 atomics_ = 0;
};

std::string Uint128ToString(Uint128 value);
