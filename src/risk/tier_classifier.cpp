#include "risk/tier_classifier.hpp"

namespace quota_watch::risk {

namespace {

constexpr model::dimension kDimensions[] = {model::dimension::FIVE_HOUR, model::dimension::WEEKLY};

}  // namespace

model::tier tier_of(const double percent, const TierThresholds& thresholds) noexcept {
  // Divide rather than scale the threshold so 70 maps exactly onto 0.70.
  // NaN compares false everywhere and lands in HEALTHY.
  const double fraction = percent / 100.0;
  if (fraction >= thresholds.critical) {
    return model::tier::CRITICAL;
  }
  if (fraction >= thresholds.danger) {
    return model::tier::DANGER;
  }
  if (fraction >= thresholds.warning) {
    return model::tier::WARNING;
  }
  return model::tier::HEALTHY;
}

model::tier peak_tier(const model::UsageSnapshot& snapshot, const TierThresholds& thresholds) noexcept {
  const auto five_hour = tier_of(snapshot.five_hour_percent, thresholds);
  const auto weekly = tier_of(snapshot.weekly_percent, thresholds);
  return five_hour > weekly ? five_hour : weekly;
}

std::vector<model::CrossingEvent> crossings(const std::optional<model::UsageSnapshot>& previous,
                                            const model::UsageSnapshot& current,
                                            const TierThresholds& thresholds) {
  std::vector<model::CrossingEvent> events;

  for (const auto which : kDimensions) {
    const auto from = previous.has_value() ? tier_of(previous->percent(which), thresholds) : model::tier::HEALTHY;
    const auto to = tier_of(current.percent(which), thresholds);
    if (to > from) {
      events.push_back({which, from, to, current.percent(which), current.captured_at});
    }
  }

  return events;
}

}  // namespace quota_watch::risk
