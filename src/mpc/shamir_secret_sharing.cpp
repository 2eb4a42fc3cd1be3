#include "cohort/mpc/fixed_point.hpp"
#include "cohort/mpc/secret_sharing.hpp"
#include "cohort/utils/logging.hpp"
#include <map>
#include <sodium.h>
#include <stdexcept>

namespace cohort {

ShamirSecretSharing::ShamirSecretSharing() {
  // Initialize libsodium if not already done
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
}

Result<std::vector<Share>>
ShamirSecretSharing::generateShares(double secret, std::size_t n,
                                    std::size_t threshold) {
  return generateShares(secret, n, threshold, fixed_point::kMaxAbsScaled);
}

Result<std::vector<Share>>
ShamirSecretSharing::generateShares(double secret, std::size_t n,
                                    std::size_t threshold,
                                    fixed_point::Scaled max_abs_scaled) {
  if (threshold < 1 || threshold > n) {
    COHORT_ERROR("Invalid threshold parameters: threshold=" << threshold
                                                           << ", total=" << n);
    return Result<std::vector<Share>>(
        ErrorCode::ValidationError,
        "Threshold must be between 1 and the number of shares (threshold=" +
            std::to_string(threshold) + ", shares=" + std::to_string(n) + ")");
  }
  if (n > kMaxParties) {
    return Result<std::vector<Share>>(
        ErrorCode::ValidationError,
        "At most " + std::to_string(kMaxParties) + " shares are supported");
  }

  auto encoded = fixed_point::encode(secret, max_abs_scaled);
  if (!encoded) {
    return Result<std::vector<Share>>(encoded.error(), encoded.message());
  }

  // p(x) = secret + a_1 x + ... + a_{t-1} x^{t-1}
  std::vector<field::Element> coefficients;
  coefficients.reserve(threshold);
  coefficients.push_back(fixed_point::toField(encoded.value()));
  for (std::size_t i = 1; i < threshold; ++i) {
    coefficients.push_back(randomElement());
  }

  std::vector<Share> shares;
  shares.reserve(n);
  for (std::size_t i = 1; i <= n; ++i) {
    Share share;
    share.party_index = static_cast<uint32_t>(i);
    share.value = evaluate(coefficients, static_cast<field::Element>(i));
    shares.push_back(share);
  }

  sodium_memzero(coefficients.data(),
                 coefficients.size() * sizeof(field::Element));

  COHORT_DEBUG("Generated " << n << " shares with threshold " << threshold);
  return shares;
}

Result<double>
ShamirSecretSharing::reconstructSecret(const std::vector<Share> &shares,
                                       std::size_t threshold) const {
  if (threshold < 1) {
    return Result<double>(ErrorCode::ValidationError,
                          "Threshold must be at least 1");
  }

  // Collapse exact repeats, reject conflicting points
  std::map<uint32_t, field::Element> points;
  for (const auto &share : shares) {
    if (share.party_index == 0) {
      return Result<double>(ErrorCode::ValidationError,
                            "Party index 0 is reserved for the secret");
    }
    if (share.value >= field::kPrime) {
      return Result<double>(ErrorCode::ValidationError,
                            "Share value is not a reduced field element");
    }
    auto [it, inserted] = points.emplace(share.party_index, share.value);
    if (!inserted && it->second != share.value) {
      COHORT_WARN("Conflicting shares for party index " << share.party_index);
      return Result<double>(ErrorCode::DuplicateShareError,
                            "Conflicting shares for party index " +
                                std::to_string(share.party_index));
    }
  }

  if (points.size() < threshold) {
    COHORT_WARN("Insufficient threshold shares: available="
                << points.size() << ", required=" << threshold);
    return Result<double>(ErrorCode::InsufficientShares,
                          "Need " + std::to_string(threshold) +
                              " distinct shares to reconstruct, got " +
                              std::to_string(points.size()));
  }

  std::vector<Share> quorum;
  quorum.reserve(threshold);
  for (const auto &[index, value] : points) {
    if (quorum.size() == threshold) break;
    quorum.push_back(Share{index, value});
  }

  field::Element secret = interpolateAtZero(quorum);
  return fixed_point::decode(fixed_point::fromField(secret));
}

Result<Share>
ShamirSecretSharing::combine(const std::vector<Share> &same_index) const {
  if (same_index.empty()) {
    return Result<Share>(ErrorCode::InsufficientShares,
                         "No shares to combine");
  }

  Share combined;
  combined.party_index = same_index.front().party_index;
  for (const auto &share : same_index) {
    if (share.party_index != combined.party_index) {
      return Result<Share>(ErrorCode::ValidationError,
                           "Cannot combine shares held at different party "
                           "indices");
    }
    combined.value = field::add(combined.value, share.value);
  }
  return combined;
}

field::Element ShamirSecretSharing::randomElement() const {
  field::Element candidate;
  do {
    randombytes_buf(&candidate, sizeof(candidate));
    candidate &= field::kPrime;
  } while (candidate >= field::kPrime);
  return candidate;
}

field::Element
ShamirSecretSharing::evaluate(const std::vector<field::Element> &coefficients,
                              field::Element x) {
  // Horner's method, highest degree first
  field::Element y = 0;
  for (auto it = coefficients.rbegin(); it != coefficients.rend(); ++it) {
    y = field::add(field::mul(y, x), *it);
  }
  return y;
}

field::Element
ShamirSecretSharing::interpolateAtZero(const std::vector<Share> &points) {
  field::Element secret = 0;
  for (std::size_t i = 0; i < points.size(); ++i) {
    field::Element numerator = 1;
    field::Element denominator = 1;
    const field::Element x_i = points[i].party_index;
    for (std::size_t j = 0; j < points.size(); ++j) {
      if (i == j) continue;
      const field::Element x_j = points[j].party_index;
      numerator = field::mul(numerator, field::neg(x_j));
      denominator = field::mul(denominator, field::sub(x_i, x_j));
    }
    field::Element lambda =
        field::mul(numerator, field::inverse(denominator));
    secret = field::add(secret, field::mul(points[i].value, lambda));
  }
  return secret;
}

} // namespace cohort
