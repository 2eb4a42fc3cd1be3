#include "cohort/mpc/secure_aggregator.hpp"
#include "cohort/mpc/fixed_point.hpp"
#include "cohort/utils/logging.hpp"
#include <algorithm>
#include <iterator>

namespace cohort {

Result<std::set<uint32_t>>
SecureAggregator::usableIndices(const SharesByParty &shares_by_party) const {
  std::set<uint32_t> usable;
  bool first = true;

  for (const auto &[party_id, shares] : shares_by_party) {
    std::map<uint32_t, field::Element> held;
    for (const auto &share : shares) {
      auto [it, inserted] = held.emplace(share.party_index, share.value);
      if (!inserted && it->second != share.value) {
        return Result<std::set<uint32_t>>(
            ErrorCode::DuplicateShareError,
            "Party '" + party_id + "' holds conflicting shares for index " +
                std::to_string(share.party_index));
      }
    }

    std::set<uint32_t> indices;
    for (const auto &[index, value] : held) {
      indices.insert(index);
    }

    if (first) {
      usable = std::move(indices);
      first = false;
    } else {
      std::set<uint32_t> common;
      std::set_intersection(usable.begin(), usable.end(), indices.begin(),
                            indices.end(),
                            std::inserter(common, common.begin()));
      usable = std::move(common);
    }
  }

  return usable;
}

Result<std::vector<Share>>
SecureAggregator::combineByIndex(const SharesByParty &shares_by_party) const {
  if (shares_by_party.size() > fixed_point::kMaxSummands) {
    return Result<std::vector<Share>>(
        ErrorCode::PrecisionLossError,
        "Cannot combine more than " +
            std::to_string(fixed_point::kMaxSummands) +
            " contributions without overflowing the field");
  }

  auto usable = usableIndices(shares_by_party);
  if (!usable) {
    return Result<std::vector<Share>>(usable.error(), usable.message());
  }

  std::vector<Share> combined;
  combined.reserve(usable.value().size());
  for (uint32_t index : usable.value()) {
    std::vector<Share> same_index;
    same_index.reserve(shares_by_party.size());
    for (const auto &[party_id, shares] : shares_by_party) {
      auto it = std::find_if(shares.begin(), shares.end(),
                             [index](const Share &s) {
                               return s.party_index == index;
                             });
      same_index.push_back(*it);
    }

    auto share = scheme_.combine(same_index);
    if (!share) {
      return Result<std::vector<Share>>(share.error(), share.message());
    }
    combined.push_back(share.value());
  }

  return combined;
}

Result<SumResult>
SecureAggregator::secureSum(const SharesByParty &shares_by_party,
                            std::size_t threshold) const {
  COHORT_DEBUG("=== SECURE SUM ===");
  COHORT_DEBUG("Contributions: " << shares_by_party.size()
                                 << ", threshold: " << threshold);

  if (shares_by_party.empty()) {
    return Result<SumResult>(ErrorCode::InsufficientShares,
                             "No contributions to aggregate");
  }

  auto combined = combineByIndex(shares_by_party);
  if (!combined) {
    return Result<SumResult>(combined.error(), combined.message());
  }

  COHORT_DEBUG("Usable share indices: " << combined.value().size());

  // The single reconstruction of the protocol: only the total is revealed
  auto total = scheme_.reconstructSecret(combined.value(), threshold);
  if (!total) {
    COHORT_WARN("Secure sum aborted: " << total.message());
    return Result<SumResult>(total.error(), total.message());
  }

  return SumResult{total.value(), shares_by_party.size()};
}

Result<MeanResult>
SecureAggregator::secureMean(const SharesByParty &shares_by_party,
                             std::size_t threshold) const {
  if (shares_by_party.empty()) {
    return Result<MeanResult>(ErrorCode::DimensionMismatch,
                              "Cannot take the mean of zero contributions");
  }

  auto sum = secureSum(shares_by_party, threshold);
  if (!sum) {
    return Result<MeanResult>(sum.error(), sum.message());
  }

  const auto count = sum.value().participant_count;
  return MeanResult{sum.value().sum / static_cast<double>(count),
                    sum.value().sum, count};
}

Result<VarianceResult>
SecureAggregator::secureVariance(const SharesByParty &shares_by_party,
                                 std::size_t threshold,
                                 const LocalDeviationStep &local_step) {
  COHORT_DEBUG("=== SECURE VARIANCE: ROUND 1 ===");
  auto mean = secureMean(shares_by_party, threshold);
  if (!mean) {
    return Result<VarianceResult>(mean.error(), mean.message());
  }

  if (!local_step) {
    return Result<VarianceResult>(ErrorCode::DimensionMismatch,
                                  "Round 2 has no party-local step");
  }

  // Round 2 shares go to the same holders as round 1
  auto usable = usableIndices(shares_by_party);
  if (!usable) {
    return Result<VarianceResult>(usable.error(), usable.message());
  }
  const std::set<uint32_t> &holders = usable.value();
  const std::size_t share_count = holders.empty() ? 0 : *holders.rbegin();

  COHORT_DEBUG("=== SECURE VARIANCE: ROUND 2 ===");
  SharesByParty round_two;
  for (const auto &[party_id, shares] : shares_by_party) {
    auto deviation = local_step(party_id, mean.value().mean);
    if (!deviation) {
      if (deviation.error() == ErrorCode::NotFoundError) {
        COHORT_WARN("Party '" << party_id << "' has no round 2 input");
        continue;
      }
      return Result<VarianceResult>(deviation.error(), deviation.message());
    }

    // Fresh polynomial per party, never a reuse of round 1 shares
    auto fresh = scheme_.generateShares(deviation.value(), share_count,
                                        threshold,
                                        fixed_point::kMaxAbsSquaredScaled);
    if (!fresh) {
      return Result<VarianceResult>(fresh.error(), fresh.message());
    }

    std::vector<Share> held;
    for (const auto &share : fresh.value()) {
      if (holders.count(share.party_index) > 0) {
        held.push_back(share);
      }
    }
    round_two.emplace(party_id, std::move(held));
  }

  if (round_two.size() != shares_by_party.size()) {
    return Result<VarianceResult>(
        ErrorCode::DimensionMismatch,
        "Round 2 received " + std::to_string(round_two.size()) +
            " contributions but round 1 had " +
            std::to_string(shares_by_party.size()));
  }

  auto squared = secureSum(round_two, threshold);
  if (!squared) {
    return Result<VarianceResult>(squared.error(), squared.message());
  }

  const auto count = mean.value().participant_count;
  return VarianceResult{squared.value().sum / static_cast<double>(count),
                        mean.value().mean, count};
}

Result<ComputationResult>
SecureAggregator::aggregate(ComputationType type,
                            const SharesByParty &shares_by_party,
                            std::size_t threshold,
                            const LocalDeviationStep &local_step) {
  ComputationResult result;
  result.security_method = scheme_.securityMethod();

  switch (type) {
  case ComputationType::Sum: {
    auto sum = secureSum(shares_by_party, threshold);
    if (!sum) return Result<ComputationResult>(sum.error(), sum.message());
    result.statistic = sum.value();
    break;
  }
  case ComputationType::Mean: {
    auto mean = secureMean(shares_by_party, threshold);
    if (!mean) return Result<ComputationResult>(mean.error(), mean.message());
    result.statistic = mean.value();
    break;
  }
  case ComputationType::Variance: {
    auto variance = secureVariance(shares_by_party, threshold, local_step);
    if (!variance) {
      return Result<ComputationResult>(variance.error(), variance.message());
    }
    result.statistic = variance.value();
    break;
  }
  }

  result.computed_at = std::chrono::system_clock::now();
  COHORT_DEBUG("Aggregated " << computationTypeToString(type) << " over "
                             << shares_by_party.size() << " contributions");
  return result;
}

} // namespace cohort
