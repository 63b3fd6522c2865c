#pragma once

#include <optional>
#include <vector>

#include "model/usage_snapshot.hpp"

namespace quota_watch::risk {

// Lower edges of warning/danger/critical as fractions of 100%.
struct TierThresholds {
  double warning{0.70};
  double danger{0.85};
  double critical{0.95};
};

[[nodiscard]] model::tier tier_of(double percent, const TierThresholds& thresholds = {}) noexcept;

// Highest tier across both dimensions.
[[nodiscard]] model::tier peak_tier(const model::UsageSnapshot& snapshot, const TierThresholds& thresholds = {}) noexcept;

// Upward tier transitions between two consecutive successful observations,
// five-hour first. An absent previous observation counts as healthy.
[[nodiscard]] std::vector<model::CrossingEvent> crossings(const std::optional<model::UsageSnapshot>& previous,
                                                          const model::UsageSnapshot& current,
                                                          const TierThresholds& thresholds = {});

}  // namespace quota_watch::risk
