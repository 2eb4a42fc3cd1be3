#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

namespace cohort {

enum class ComputationType { Sum = 0, Mean, Variance };

inline std::string computationTypeToString(ComputationType type) {
  switch (type) {
  case ComputationType::Sum: return "sum";
  case ComputationType::Mean: return "mean";
  case ComputationType::Variance: return "variance";
  }
  return "unknown";
}

inline std::optional<ComputationType>
parseComputationType(const std::string &name) {
  if (name == "sum") return ComputationType::Sum;
  if (name == "mean") return ComputationType::Mean;
  if (name == "variance") return ComputationType::Variance;
  return std::nullopt;
}

struct SumResult {
  double sum = 0.0;
  std::size_t participant_count = 0;
};

struct MeanResult {
  double mean = 0.0;
  double sum = 0.0;
  std::size_t participant_count = 0;
};

// Population variance
struct VarianceResult {
  double variance = 0.0;
  double mean = 0.0;
  std::size_t participant_count = 0;
};

using Statistic = std::variant<SumResult, MeanResult, VarianceResult>;

struct ComputationResult {
  Statistic statistic;
  std::string security_method;
  std::chrono::time_point<std::chrono::system_clock> computed_at;

  ComputationType type() const {
    return static_cast<ComputationType>(statistic.index());
  }

  // The statistic named by the operation type
  double value() const {
    return std::visit(
        [](const auto &s) -> double {
          using T = std::decay_t<decltype(s)>;
          if constexpr (std::is_same_v<T, SumResult>) return s.sum;
          else if constexpr (std::is_same_v<T, MeanResult>) return s.mean;
          else return s.variance;
        },
        statistic);
  }

  std::size_t participantCount() const {
    return std::visit([](const auto &s) { return s.participant_count; },
                      statistic);
  }
};

// JSON conversion functions for ComputationResult
inline void to_json(nlohmann::json &j, const ComputationResult &r) {
  j = nlohmann::json{
      {"type", computationTypeToString(r.type())},
      {"value", r.value()},
      {"participant_count", r.participantCount()},
      {"security_method", r.security_method},
      {"computed_at", std::chrono::duration_cast<std::chrono::milliseconds>(
                          r.computed_at.time_since_epoch())
                          .count()}};

  if (const auto *mean = std::get_if<MeanResult>(&r.statistic)) {
    j["sum"] = mean->sum;
  } else if (const auto *variance = std::get_if<VarianceResult>(&r.statistic)) {
    j["mean"] = variance->mean;
  }
}

inline void from_json(const nlohmann::json &j, ComputationResult &r) {
  auto type = parseComputationType(j.at("type").get<std::string>());
  if (!type) {
    throw std::invalid_argument("Unknown computation type in result: " +
                                j.at("type").get<std::string>());
  }

  double value = j.at("value").get<double>();
  std::size_t count = j.at("participant_count").get<std::size_t>();
  switch (*type) {
  case ComputationType::Sum:
    r.statistic = SumResult{value, count};
    break;
  case ComputationType::Mean:
    r.statistic = MeanResult{value, j.at("sum").get<double>(), count};
    break;
  case ComputationType::Variance:
    r.statistic = VarianceResult{value, j.at("mean").get<double>(), count};
    break;
  }

  j.at("security_method").get_to(r.security_method);
  int64_t computed_ms = j.at("computed_at");
  r.computed_at = std::chrono::system_clock::time_point(
      std::chrono::milliseconds(computed_ms));
}

} // namespace cohort
