#pragma once
#include <string>
#include <algorithm>
#include <cctype>
#include <stdexcept>

inline bool Has0x(const std::string& s) {
  return s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
}

inline std::string Strip0x(const std::string& s) {
  if (Has0x(s)) return s.substr(2);
  return s;
}

inline std::string ToLowerHex(const std::string& s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return out;
}

inline bool IsHexDigits(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isxdigit(c) != 0; });
}

// Raw bytes -> lowercase hex, no prefix.
inline std::string BytesToHex(const std::string& bytes) {
  static const char* hex = "0123456789abcdef";
  std::string out; out.reserve(bytes.size() * 2);
  for (unsigned char b : bytes) { out += hex[b >> 4]; out += hex[b & 0xF]; }
  return out;
}

// Hex (optionally 0x-prefixed, any case) -> raw bytes. Throws std::invalid_argument.
inline std::string HexToBytes(const std::string& hex_input) {
  const std::string digits = Strip0x(hex_input);
  if (digits.size() % 2 != 0) throw std::invalid_argument("odd hex length");
  if (!IsHexDigits(digits)) throw std::invalid_argument("non-hex character");
  auto val = [](char c)->int{ if (c>='0'&&c<='9') return c-'0'; if (c>='a'&&c<='f') return 10+c-'a'; return 10+c-'A'; };
  std::string bytes; bytes.reserve(digits.size() / 2);
  for (size_t i = 0; i + 1 < digits.size(); i += 2) {
    bytes.push_back(static_cast<char>((val(digits[i]) << 4) | val(digits[i+1])));
  }
  return bytes;
}
