#pragma once

#include <array>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "model/usage_snapshot.hpp"
#include "risk/tier_classifier.hpp"
#include "sinks/notifier.hpp"

namespace quota_watch::sinks {

// Routes crossings and authentication failures to a Notifier.
//
// A tier fires at most once per dimension until that dimension falls back to
// healthy. Authentication failures fire once until the next success. Only
// tiers listed in NotificationConfig::tiers are delivered. Delivery failures
// are logged and never reach the caller.
class AlertDispatcher {
 public:
  AlertDispatcher(core::NotificationConfig config, risk::TierThresholds thresholds, std::unique_ptr<Notifier> notifier);

  // Returns the number of notifications delivered.
  std::size_t on_success(const model::UsageSnapshot& snapshot, const std::vector<model::CrossingEvent>& events);

  std::size_t on_failure(model::error_kind kind);

  [[nodiscard]] bool tier_armed(model::dimension which, model::tier level) const noexcept;

 private:
  bool deliver(const Notification& notification);
  [[nodiscard]] bool tier_enabled(model::tier level) const noexcept;

  core::NotificationConfig config_;
  risk::TierThresholds thresholds_;
  std::unique_ptr<Notifier> notifier_;
  // [dimension][tier]
  std::array<std::array<bool, 4>, 2> notified_{};
  bool auth_notified_{false};
};

Notification make_crossing_notification(const model::CrossingEvent& event);
Notification make_auth_notification(model::error_kind kind);

}  // namespace quota_watch::sinks
