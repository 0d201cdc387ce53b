#pragma once

#include <optional>
#include <string>

namespace facefind_core {

enum class ThresholdTier { Strict, Standard, Loose };

std::string to_string(ThresholdTier tier);
ThresholdTier threshold_tier_from_string(const std::string& str);

// Cosine similarity cutoffs; a face matches when its score is above the cutoff.
struct ThresholdTable {
  float strict = 0.72f;
  float standard = 0.60f;
  float loose = 0.48f;
};

class ThresholdPolicy {
 public:
  // Throws std::invalid_argument unless -1 <= loose <= standard <= strict <= 1.
  explicit ThresholdPolicy(ThresholdTable table = ThresholdTable{});

  float cutoff(ThresholdTier tier) const;

  // A raw threshold, when given, wins over the tier.
  float resolve(ThresholdTier tier, const std::optional<float>& raw_threshold) const;

  const ThresholdTable& table() const {
    return table_;
  }

 private:
  ThresholdTable table_;
};

}  // namespace facefind_core
