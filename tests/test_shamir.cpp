#include <gtest/gtest.h>
#include "cohort/mpc/secret_sharing.hpp"
#include <algorithm>
#include <set>
#include <vector>

using namespace cohort;

class ShamirTest : public ::testing::Test {
protected:
  ShamirSecretSharing scheme_;
};

// ============================================================================
// Share generation
// ============================================================================

TEST_F(ShamirTest, GeneratesOneSharePerPartyIndex) {
  auto shares = scheme_.generateShares(42.0, 5, 3);
  ASSERT_TRUE(shares);
  ASSERT_EQ(shares.value().size(), 5u);

  std::set<uint32_t> indices;
  for (const auto &share : shares.value()) {
    indices.insert(share.party_index);
    EXPECT_TRUE(share.value < field::kPrime);
  }
  EXPECT_EQ(indices, (std::set<uint32_t>{1, 2, 3, 4, 5}));
}

TEST_F(ShamirTest, RejectsInvalidThresholds) {
  EXPECT_EQ(scheme_.generateShares(1.0, 3, 0).error(),
            ErrorCode::ValidationError);
  EXPECT_EQ(scheme_.generateShares(1.0, 3, 4).error(),
            ErrorCode::ValidationError);
  EXPECT_EQ(scheme_.generateShares(1.0, ShamirSecretSharing::kMaxParties + 1, 2)
                .error(),
            ErrorCode::ValidationError);
}

TEST_F(ShamirTest, RejectsUnencodableSecrets) {
  EXPECT_EQ(scheme_.generateShares(5.0e12, 3, 2).error(),
            ErrorCode::PrecisionLossError);
}

TEST_F(ShamirTest, SharesAreFreshPerCall) {
  auto first = scheme_.generateShares(7.0, 3, 2);
  auto second = scheme_.generateShares(7.0, 3, 2);
  ASSERT_TRUE(first);
  ASSERT_TRUE(second);
  EXPECT_NE(first.value(), second.value());
}

// ============================================================================
// Reconstruction
// ============================================================================

TEST_F(ShamirTest, RoundTripAcrossThresholdsAndPartyCounts) {
  const std::vector<double> secrets = {0.0, 1.0, -1.0, 10.5, -273.15,
                                       123456.789012, 1.0e9};
  for (std::size_t n = 1; n <= 7; ++n) {
    for (std::size_t t = 1; t <= n; ++t) {
      for (double secret : secrets) {
        auto shares = scheme_.generateShares(secret, n, t);
        ASSERT_TRUE(shares) << shares.message();

        auto recovered = scheme_.reconstructSecret(shares.value(), t);
        ASSERT_TRUE(recovered) << recovered.message();
        EXPECT_NEAR(recovered.value(), secret, 1e-6)
            << "n=" << n << " t=" << t;
      }
    }
  }
}

TEST_F(ShamirTest, AnyQuorumSubsetReconstructs) {
  auto shares = scheme_.generateShares(99.125, 5, 3);
  ASSERT_TRUE(shares);

  std::vector<Share> subset = {shares.value()[4], shares.value()[1],
                               shares.value()[2]};
  auto recovered = scheme_.reconstructSecret(subset, 3);
  ASSERT_TRUE(recovered);
  EXPECT_NEAR(recovered.value(), 99.125, 1e-6);
}

TEST_F(ShamirTest, FewerThanThresholdSharesFail) {
  auto shares = scheme_.generateShares(55.5, 5, 3);
  ASSERT_TRUE(shares);

  std::vector<Share> subset(shares.value().begin(),
                            shares.value().begin() + 2);
  auto recovered = scheme_.reconstructSecret(subset, 3);
  EXPECT_EQ(recovered.error(), ErrorCode::InsufficientShares);
}

TEST_F(ShamirTest, RepeatedIdenticalSharesCountOnce) {
  auto shares = scheme_.generateShares(12.0, 3, 2);
  ASSERT_TRUE(shares);

  std::vector<Share> repeated = {shares.value()[0], shares.value()[0]};
  EXPECT_EQ(scheme_.reconstructSecret(repeated, 2).error(),
            ErrorCode::InsufficientShares);

  repeated.push_back(shares.value()[1]);
  auto recovered = scheme_.reconstructSecret(repeated, 2);
  ASSERT_TRUE(recovered);
  EXPECT_NEAR(recovered.value(), 12.0, 1e-6);
}

TEST_F(ShamirTest, ConflictingSharesAreRejected) {
  auto shares = scheme_.generateShares(12.0, 3, 2);
  ASSERT_TRUE(shares);

  Share forged = shares.value()[0];
  forged.value = field::add(forged.value, 1);
  std::vector<Share> conflicting = {shares.value()[0], forged,
                                    shares.value()[1]};
  EXPECT_EQ(scheme_.reconstructSecret(conflicting, 2).error(),
            ErrorCode::DuplicateShareError);
}

TEST_F(ShamirTest, RejectsMalformedShares) {
  std::vector<Share> zero_index = {Share{0, 5}, Share{1, 6}};
  EXPECT_EQ(scheme_.reconstructSecret(zero_index, 2).error(),
            ErrorCode::ValidationError);

  std::vector<Share> unreduced = {Share{1, field::kPrime}, Share{2, 6}};
  EXPECT_EQ(scheme_.reconstructSecret(unreduced, 2).error(),
            ErrorCode::ValidationError);
}

// ============================================================================
// Additive combination
// ============================================================================

TEST_F(ShamirTest, CombinedSharesReconstructTheSum) {
  auto a = scheme_.generateShares(10.5, 4, 3);
  auto b = scheme_.generateShares(-3.25, 4, 3);
  ASSERT_TRUE(a);
  ASSERT_TRUE(b);

  std::vector<Share> combined;
  for (std::size_t i = 0; i < 4; ++i) {
    auto share = scheme_.combine({a.value()[i], b.value()[i]});
    ASSERT_TRUE(share);
    combined.push_back(share.value());
  }

  auto total = scheme_.reconstructSecret(combined, 3);
  ASSERT_TRUE(total);
  EXPECT_NEAR(total.value(), 7.25, 1e-6);
}

TEST_F(ShamirTest, CombineRejectsMixedIndices) {
  EXPECT_EQ(scheme_.combine({Share{1, 3}, Share{2, 4}}).error(),
            ErrorCode::ValidationError);
  EXPECT_EQ(scheme_.combine({}).error(), ErrorCode::InsufficientShares);
}

TEST_F(ShamirTest, ReportsSecurityMethod) {
  EXPECT_EQ(scheme_.securityMethod(), "shamir-threshold-v1");
}
