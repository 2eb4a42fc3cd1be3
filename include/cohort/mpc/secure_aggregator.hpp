#pragma once
#include "cohort/mpc/computation_result.hpp"
#include "cohort/mpc/secret_sharing.hpp"
#include "cohort/utils/error_codes.hpp"
#include <cstddef>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace cohort {

// Every share of one party's secret, keyed by party (organization) id
using SharesByParty = std::map<std::string, std::vector<Share>>;

// Party-local step of the variance protocol: given the round-1 mean, the
// party returns its squared deviation (value - mean)^2. A party that holds
// no local input returns NotFoundError and is left out of round 2.
using LocalDeviationStep =
    std::function<Result<double>(const std::string &party_id, double mean)>;

// Computes statistics over shared values by combining shares index-wise
// before a single reconstruction. Individual inputs are never reconstructed.
class SecureAggregator {
public:
  explicit SecureAggregator(SecretSharingScheme &scheme) : scheme_(scheme) {}

  Result<SumResult> secureSum(const SharesByParty &shares_by_party,
                              std::size_t threshold) const;

  Result<MeanResult> secureMean(const SharesByParty &shares_by_party,
                                std::size_t threshold) const;

  // Two rounds: secure mean, then a secure sum over freshly shared squared
  // deviations. Either round failing aborts the whole computation.
  Result<VarianceResult> secureVariance(const SharesByParty &shares_by_party,
                                        std::size_t threshold,
                                        const LocalDeviationStep &local_step);

  Result<ComputationResult> aggregate(ComputationType type,
                                      const SharesByParty &shares_by_party,
                                      std::size_t threshold,
                                      const LocalDeviationStep &local_step = {});

private:
  // Party indices held for every contributing party
  Result<std::set<uint32_t>>
  usableIndices(const SharesByParty &shares_by_party) const;

  // Index-wise additive combination over the usable indices
  Result<std::vector<Share>>
  combineByIndex(const SharesByParty &shares_by_party) const;

  SecretSharingScheme &scheme_;
};

} // namespace cohort
