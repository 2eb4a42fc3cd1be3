#pragma once
#include "cohort/utils/error_codes.hpp"
#include <optional>
#include <string>
#include <vector>

namespace cohort {

// Plausible physiological range for one metric type, inclusive
struct MetricRange {
  std::string metric_type;
  double min;
  double max;
  std::string unit;
};

// Sanity checks applied to submitted health metrics before they are shared
class MetricValidator {
public:
  static const std::vector<MetricRange> &knownMetrics();

  static std::optional<MetricRange> rangeFor(const std::string &metric_type);

  static bool isKnownMetric(const std::string &metric_type) {
    return rangeFor(metric_type).has_value();
  }

  // Without a metric type only finiteness is checked
  static Result<double> validate(const std::optional<std::string> &metric_type,
                                 double value);
};

} // namespace cohort
