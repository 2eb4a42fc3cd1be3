#pragma once
#include "cohort/mpc/field.hpp"
#include "cohort/utils/error_codes.hpp"
#include <cstddef>
#include <cstdint>

namespace cohort {

// Decimal <-> fixed-point <-> field element mapping shared by every scheme.
//
// Values are scaled by 10^6 and rounded to the nearest integer. An input
// value must satisfy |x| <= 2^50 after scaling. Squared deviations of such
// inputs stay below 2^84, so the sum of up to kMaxSummands of either still
// decodes unambiguously from GF(2^127 - 1).
namespace fixed_point {

using Scaled = __int128;

constexpr int kScaleDigits = 6;
constexpr int64_t kScale = 1000000;
constexpr Scaled kMaxAbsScaled = Scaled{1} << 50;
constexpr Scaled kMaxAbsSquaredScaled = Scaled{1} << 84;
constexpr std::size_t kMaxSummands = 1000;

// Half-width of the field: elements above it decode as negative.
constexpr field::Element kHalfPrime = (field::kPrime - 1) / 2;

// Largest input magnitude accepted in real units (about 1.1259e9).
constexpr double maxMagnitude() noexcept {
  return static_cast<double>(kMaxAbsScaled) / static_cast<double>(kScale);
}

// Fails with PrecisionLossError for NaN, infinities and values whose scaled
// magnitude exceeds max_abs_scaled.
Result<Scaled> encode(double value, Scaled max_abs_scaled = kMaxAbsScaled);

double decode(Scaled scaled) noexcept;

field::Element toField(Scaled scaled) noexcept;

// Signed decode of a field element. Only meaningful for elements produced
// from sums of at most kMaxSummands encoded values.
Scaled fromField(field::Element element) noexcept;

} // namespace fixed_point
} // namespace cohort
