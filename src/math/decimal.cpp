#include "math/decimal.hpp"
#include "common/errors.hpp"
#include <algorithm>

static bool ParseDigits(const std::string& digits, Uint128& out) {
  if (digits.empty()) return false;
  const Uint128 max = ~static_cast<Uint128>(0);
  Uint128 v = 0;
  for (char c : digits) {
    if (c < '0' || c > '9') return false;
    unsigned d = static_cast<unsigned>(c - '0');
    if (v > (max - d) / 10) return false;
    v = v * 10 + d;
  }
  out = v;
  return true;
}

std::string Uint128ToString(Uint128 value) {
  if (value == 0) return "0";
  std::string out;
  while (value > 0) {
    out.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
    value /= 10;
  }
  std::reverse(out.begin(), out.end());
  return out;
}

Decimal Decimal::FromAtomics(Uint128 atomics) { return Decimal(atomics); }

Decimal Decimal::FromInteger(uint64_t whole) {
  return Decimal(static_cast<Uint128>(whole) * kFractionalScale);
}

Decimal Decimal::FromString(const std::string& text) {
  auto dot = text.find('.');
  std::string whole_part = text.substr(0, dot);
  Uint128 whole = 0;
  if (!ParseDigits(whole_part, whole)) {
    throw ContractError::InvalidInput("error parsing whole part of decimal '" + text + "'");
  }
  const Uint128 max = ~static_cast<Uint128>(0);
  if (whole > max / kFractionalScale) {
    throw ContractError::InvalidInput("decimal value too big '" + text + "'");
  }
  Uint128 atomics = whole * kFractionalScale;
  if (dot == std::string::npos) return Decimal(atomics);

  std::string frac_part = text.substr(dot + 1);
  if (frac_part.size() > kFractionalDigits) {
    throw ContractError::InvalidInput("cannot parse more than 18 fractional digits");
  }
  Uint128 frac = 0;
  if (!ParseDigits(frac_part, frac)) {
    throw ContractError::InvalidInput("error parsing fractional part of decimal '" + text + "'");
  }
  for (size_t i = frac_part.size(); i < kFractionalDigits; ++i) frac *= 10;
  if (atomics > max - frac) {
    throw ContractError::InvalidInput("decimal value too big '" + text + "'");
  }
  return Decimal(atomics + frac);
}

std::string Decimal::ToString() const {
  Uint128 whole = atomics_ / kFractionalScale;
  Uint128 frac = atomics_ % kFractionalScale;
  std::string out = Uint128ToString(whole);
  if (frac == 0) return out;
  std::string frac_str = Uint128ToString(frac);
  frac_str.insert(0, kFractionalDigits - frac_str.size(), '0');
  while (!frac_str.empty() && frac_str.back() == '0') frac_str.pop_back();
  return out + "." + frac_str;
}
