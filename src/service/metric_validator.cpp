#include "cohort/service/metric_validator.hpp"
#include "cohort/utils/logging.hpp"
#include <cmath>
#include <sstream>

namespace cohort {

const std::vector<MetricRange> &MetricValidator::knownMetrics() {
  static const std::vector<MetricRange> metrics = {
      {"blood_pressure", 50.0, 250.0, "mmHg"},
      {"blood_glucose", 30.0, 500.0, "mg/dL"},
      {"heart_rate", 30.0, 220.0, "bpm"},
  };
  return metrics;
}

std::optional<MetricRange>
MetricValidator::rangeFor(const std::string &metric_type) {
  for (const auto &range : knownMetrics()) {
    if (range.metric_type == metric_type) {
      return range;
    }
  }
  return std::nullopt;
}

Result<double>
MetricValidator::validate(const std::optional<std::string> &metric_type,
                          double value) {
  if (!std::isfinite(value)) {
    return Result<double>(ErrorCode::ValidationError,
                          "Metric value must be a finite number");
  }
  if (!metric_type) {
    return value;
  }

  auto range = rangeFor(*metric_type);
  if (!range) {
    return Result<double>(ErrorCode::ValidationError,
                          "Unsupported metric type: " + *metric_type);
  }

  if (value < range->min || value > range->max) {
    std::ostringstream message;
    message << "Invalid " << range->metric_type << " value. Must be between "
            << range->min << " and " << range->max << " " << range->unit;
    COHORT_DEBUG("Rejected out-of-range " << range->metric_type << " value");
    return Result<double>(ErrorCode::ValidationError, message.str());
  }
  return value;
}

} // namespace cohort
