#include "facefind_core/services/threshold_policy.hpp"

#include <cmath>
#include <stdexcept>

namespace facefind_core {

std::string to_string(ThresholdTier tier) {
  switch (tier) {
    case ThresholdTier::Strict:
      return "strict";
    case ThresholdTier::Standard:
      return "standard";
    case ThresholdTier::Loose:
      return "loose";
    default:
      return "unknown";
  }
}

ThresholdTier threshold_tier_from_string(const std::string& str) {
  if (str == "strict")
    return ThresholdTier::Strict;
  if (str == "standard")
    return ThresholdTier::Standard;
  if (str == "loose")
    return ThresholdTier::Loose;
  throw std::invalid_argument("Unknown threshold tier: " + str);
}

ThresholdPolicy::ThresholdPolicy(ThresholdTable table) : table_(table) {
  if (!(table_.loose >= -1.0f && table_.strict <= 1.0f)) {
    throw std::invalid_argument("Threshold cutoffs must lie within [-1, 1]");
  }
  if (!(table_.strict >= table_.standard && table_.standard >= table_.loose)) {
    throw std::invalid_argument("Threshold cutoffs must satisfy strict >= standard >= loose");
  }
}

float ThresholdPolicy::cutoff(ThresholdTier tier) const {
  switch (tier) {
    case ThresholdTier::Strict:
      return table_.strict;
    case ThresholdTier::Loose:
      return table_.loose;
    case ThresholdTier::Standard:
    default:
      return table_.standard;
  }
}

float ThresholdPolicy::resolve(ThresholdTier tier, const std::optional<float>& raw_threshold) const {
  if (!raw_threshold) {
    return cutoff(tier);
  }
  if (!std::isfinite(*raw_threshold) || *raw_threshold < -1.0f || *raw_threshold > 1.0f) {
    throw std::invalid_argument("Raw threshold must be a similarity within [-1, 1]");
  }
  return *raw_threshold;
}

}  // namespace facefind_core
