#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace cohort {

// Arithmetic in GF(p) with the Mersenne prime p = 2^127 - 1.
// Elements are always kept fully reduced into [0, p).
namespace field {

using Element = unsigned __int128;

constexpr Element kPrime = (Element{1} << 127) - 1;

// Reduce high * 2^128 + low, high < 2^126. 2^127 = 1 and 2^128 = 2 (mod p).
inline Element reduce(Element high, Element low) noexcept {
  Element folded = (low & kPrime) + (low >> 127) + (high << 1);
  folded = (folded & kPrime) + (folded >> 127);
  return folded >= kPrime ? folded - kPrime : folded;
}

inline Element add(Element a, Element b) noexcept {
  Element sum = a + b;
  return sum >= kPrime ? sum - kPrime : sum;
}

inline Element sub(Element a, Element b) noexcept {
  return a >= b ? a - b : a + kPrime - b;
}

inline Element neg(Element a) noexcept { return a == 0 ? 0 : kPrime - a; }

inline Element mul(Element a, Element b) noexcept {
  // Schoolbook 128 x 128 -> 256 over 64-bit limbs
  const Element a0 = static_cast<uint64_t>(a);
  const Element a1 = static_cast<uint64_t>(a >> 64);
  const Element b0 = static_cast<uint64_t>(b);
  const Element b1 = static_cast<uint64_t>(b >> 64);

  const Element p00 = a0 * b0;
  const Element p01 = a0 * b1;
  const Element p10 = a1 * b0;
  const Element p11 = a1 * b1;

  const Element middle = (p00 >> 64) + static_cast<uint64_t>(p01) +
                         static_cast<uint64_t>(p10);
  const Element low = static_cast<uint64_t>(p00) | (middle << 64);
  const Element high = p11 + (p01 >> 64) + (p10 >> 64) + (middle >> 64);
  return reduce(high, low);
}

inline Element pow(Element base, Element exponent) noexcept {
  Element result = 1;
  while (exponent > 0) {
    if (exponent & 1) result = mul(result, base);
    base = mul(base, base);
    exponent >>= 1;
  }
  return result;
}

// Multiplicative inverse by Fermat's little theorem. inverse(0) is 0.
inline Element inverse(Element a) noexcept { return pow(a, kPrime - 2); }

// Decimal text form, used wherever an element is serialized
inline std::string toString(Element a) {
  if (a == 0) return "0";
  std::string digits;
  while (a > 0) {
    digits.push_back(static_cast<char>('0' + static_cast<int>(a % 10)));
    a /= 10;
  }
  return std::string(digits.rbegin(), digits.rend());
}

// Parses a reduced element; nullopt for anything else
inline std::optional<Element> fromString(const std::string &text) {
  if (text.empty()) return std::nullopt;
  Element value = 0;
  for (char c : text) {
    if (c < '0' || c > '9') return std::nullopt;
    const Element digit = static_cast<Element>(c - '0');
    if (value > (kPrime - digit) / 10) return std::nullopt;
    value = value * 10 + digit;
  }
  if (value >= kPrime) return std::nullopt;
  return value;
}

} // namespace field
} // namespace cohort
