#include "cohort/mpc/fixed_point.hpp"
#include "cohort/utils/logging.hpp"
#include <cmath>
#include <string>

namespace cohort {
namespace fixed_point {

Result<Scaled> encode(double value, Scaled max_abs_scaled) {
  if (!std::isfinite(value)) {
    COHORT_WARN("Rejected non-finite secret value");
    return Result<Scaled>(ErrorCode::PrecisionLossError,
                          "Value is not a finite number");
  }

  // Range check before the integer conversion so the cast never overflows
  const double limit = static_cast<double>(max_abs_scaled);
  double scaled = std::round(value * static_cast<double>(kScale));
  if (std::fabs(scaled) > limit) {
    COHORT_WARN("Rejected secret value outside the fixed-point range");
    return Result<Scaled>(
        ErrorCode::PrecisionLossError,
        "Value magnitude exceeds the supported fixed-point range of +/-" +
            std::to_string(limit / static_cast<double>(kScale)));
  }

  return static_cast<Scaled>(scaled);
}

double decode(Scaled scaled) noexcept {
  return static_cast<double>(scaled) / static_cast<double>(kScale);
}

field::Element toField(Scaled scaled) noexcept {
  if (scaled >= 0) {
    return static_cast<field::Element>(scaled) % field::kPrime;
  }
  // Negative values map to p - |x|
  field::Element magnitude = static_cast<field::Element>(-(scaled + 1)) + 1;
  return field::neg(magnitude % field::kPrime);
}

Scaled fromField(field::Element element) noexcept {
  if (element <= kHalfPrime) {
    return static_cast<Scaled>(element);
  }
  return -static_cast<Scaled>(field::kPrime - element);
}

} // namespace fixed_point
} // namespace cohort
