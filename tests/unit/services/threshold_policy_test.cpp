#include <gtest/gtest.h>

#include "facefind_core/services/threshold_policy.hpp"

namespace facefind_tests {

using facefind_core::ThresholdPolicy;
using facefind_core::ThresholdTable;
using facefind_core::ThresholdTier;

TEST(ThresholdPolicyTest, DefaultTableIsMonotonic) {
  ThresholdPolicy policy;

  EXPECT_GE(policy.cutoff(ThresholdTier::Strict), policy.cutoff(ThresholdTier::Standard));
  EXPECT_GE(policy.cutoff(ThresholdTier::Standard), policy.cutoff(ThresholdTier::Loose));
  EXPECT_FLOAT_EQ(policy.cutoff(ThresholdTier::Standard), 0.60f);
}

TEST(ThresholdPolicyTest, RawThresholdOverridesTier) {
  ThresholdPolicy policy;

  EXPECT_FLOAT_EQ(policy.resolve(ThresholdTier::Strict, 0.1f), 0.1f);
  EXPECT_FLOAT_EQ(policy.resolve(ThresholdTier::Loose, std::nullopt), 0.48f);
}

TEST(ThresholdPolicyTest, RawThresholdOutOfRangeRejected) {
  ThresholdPolicy policy;

  EXPECT_THROW(policy.resolve(ThresholdTier::Standard, 1.5f), std::invalid_argument);
  EXPECT_THROW(policy.resolve(ThresholdTier::Standard, -2.0f), std::invalid_argument);
}

TEST(ThresholdPolicyTest, NonMonotonicTableRejected) {
  ThresholdTable table;
  table.strict = 0.5f;
  table.standard = 0.6f;

  EXPECT_THROW(ThresholdPolicy{table}, std::invalid_argument);
}

TEST(ThresholdPolicyTest, TierNamesRoundTrip) {
  EXPECT_EQ(facefind_core::threshold_tier_from_string("strict"), ThresholdTier::Strict);
  EXPECT_EQ(facefind_core::to_string(ThresholdTier::Loose), "loose");
  EXPECT_THROW(facefind_core::threshold_tier_from_string("fuzzy"), std::invalid_argument);
}

}  // namespace facefind_tests
