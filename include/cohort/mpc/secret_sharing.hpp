#pragma once
#include "cohort/mpc/field.hpp"
#include "cohort/mpc/fixed_point.hpp"
#include "cohort/utils/error_codes.hpp"
#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace cohort {

// One point of a shared secret. party_index is the evaluation point (>= 1).
struct Share {
  uint32_t party_index = 0;
  field::Element value = 0;
};

inline bool operator==(const Share &a, const Share &b) {
  return a.party_index == b.party_index && a.value == b.value;
}

// Share values are wider than any JSON number, so they travel as decimal text
inline void to_json(nlohmann::json &j, const Share &s) {
  j = nlohmann::json{{"party_index", s.party_index},
                     {"value", field::toString(s.value)}};
}

inline void from_json(const nlohmann::json &j, Share &s) {
  j.at("party_index").get_to(s.party_index);
  auto value = field::fromString(j.at("value").get<std::string>());
  if (!value) {
    throw std::invalid_argument("Share value is not a reduced field element");
  }
  s.value = *value;
}

// Abstract threshold secret sharing scheme.
// Handles the primitive only: split -> combine -> reconstruct. Sessions and
// aggregation are layered on top and never see polynomial coefficients.
class SecretSharingScheme {
public:
  virtual ~SecretSharingScheme() = default;

  // Split secret into n shares at party indices 1..n so that any threshold of
  // them reconstruct it and fewer reveal nothing.
  virtual Result<std::vector<Share>> generateShares(double secret,
                                                    std::size_t n,
                                                    std::size_t threshold) = 0;

  // Same, for secrets bounded by max_abs_scaled instead of the input range
  virtual Result<std::vector<Share>>
  generateShares(double secret, std::size_t n, std::size_t threshold,
                 fixed_point::Scaled max_abs_scaled) = 0;

  // Recover the secret from at least threshold distinct party indices
  virtual Result<double> reconstructSecret(const std::vector<Share> &shares,
                                           std::size_t threshold) const = 0;

  // Additive combination of shares held at the same party index. The result
  // is a share of the sum of the underlying secrets.
  virtual Result<Share> combine(const std::vector<Share> &same_index) const = 0;

  // Scheme identifier recorded with every result for audit and migration
  virtual std::string securityMethod() const = 0;
};

// Shamir sharing over GF(2^127 - 1) with fixed-point encoded secrets.
// Polynomial coefficients come from the libsodium CSPRNG.
class ShamirSecretSharing : public SecretSharingScheme {
public:
  static constexpr const char *kSecurityMethod = "shamir-threshold-v1";
  static constexpr std::size_t kMaxParties = 1000;

  ShamirSecretSharing();

  Result<std::vector<Share>> generateShares(double secret, std::size_t n,
                                            std::size_t threshold) override;

  Result<std::vector<Share>>
  generateShares(double secret, std::size_t n, std::size_t threshold,
                 fixed_point::Scaled max_abs_scaled) override;

  Result<double> reconstructSecret(const std::vector<Share> &shares,
                                   std::size_t threshold) const override;

  Result<Share> combine(const std::vector<Share> &same_index) const override;

  std::string securityMethod() const override { return kSecurityMethod; }

private:
  // Uniform element of [0, p) by rejection sampling
  field::Element randomElement() const;

  static field::Element evaluate(const std::vector<field::Element> &coefficients,
                                 field::Element x);

  // Lagrange interpolation at x = 0 over exactly the given points
  static field::Element interpolateAtZero(const std::vector<Share> &points);
};

} // namespace cohort
