#include "sinks/alert_dispatcher.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <utility>

namespace quota_watch::sinks {
namespace {

std::size_t index_of(const model::dimension which) { return static_cast<std::size_t>(which); }
std::size_t index_of(const model::tier level) { return static_cast<std::size_t>(level); }

const char* limit_label(const model::dimension which) {
  return which == model::dimension::FIVE_HOUR ? "5h limit" : "Weekly limit";
}

std::string whole_percent(const double percent) { return std::to_string(std::lround(percent)) + "%"; }

}  // namespace

AlertDispatcher::AlertDispatcher(core::NotificationConfig config, risk::TierThresholds thresholds,
                                 std::unique_ptr<Notifier> notifier)
    : config_(std::move(config)), thresholds_(thresholds), notifier_(std::move(notifier)) {}

std::size_t AlertDispatcher::on_success(const model::UsageSnapshot& snapshot,
                                        const std::vector<model::CrossingEvent>& events) {
  auth_notified_ = false;

  for (const auto which : {model::dimension::FIVE_HOUR, model::dimension::WEEKLY}) {
    if (risk::tier_of(snapshot.percent(which), thresholds_) == model::tier::HEALTHY) {
      notified_[index_of(which)].fill(false);
    }
  }

  std::size_t delivered = 0;
  for (const auto& event : events) {
    if (!tier_enabled(event.to)) {
      continue;
    }

    bool& fired = notified_[index_of(event.which)][index_of(event.to)];
    if (fired) {
      continue;
    }
    fired = true;

    if (deliver(make_crossing_notification(event))) {
      ++delivered;
    }
  }
  return delivered;
}

std::size_t AlertDispatcher::on_failure(const model::error_kind kind) {
  if (!model::is_auth_failure(kind) || auth_notified_) {
    return 0;
  }
  auth_notified_ = true;
  return deliver(make_auth_notification(kind)) ? 1 : 0;
}

bool AlertDispatcher::tier_armed(const model::dimension which, const model::tier level) const noexcept {
  return !notified_[index_of(which)][index_of(level)];
}

bool AlertDispatcher::deliver(const Notification& notification) {
  if (notifier_ == nullptr) {
    return false;
  }

  try {
    notifier_->notify(notification);
    return true;
  } catch (const std::exception& ex) {
    std::cerr << "[notify] delivery failed for \"" << notification.title << "\": " << ex.what() << '\n';
    return false;
  } catch (...) {
    std::cerr << "[notify] delivery failed for \"" << notification.title << "\": non-standard exception\n";
    return false;
  }
}

bool AlertDispatcher::tier_enabled(const model::tier level) const noexcept {
  return std::find(config_.tiers.begin(), config_.tiers.end(), level) != config_.tiers.end();
}

Notification make_crossing_notification(const model::CrossingEvent& event) {
  const std::string pct = whole_percent(event.percent);
  const std::string label = limit_label(event.which);

  switch (event.to) {
    case model::tier::CRITICAL:
      return {"⚠️ Usage Critical!", "You've used " + pct + " of your " + label + ". Consider pausing.", urgency::CRITICAL};
    case model::tier::DANGER:
      return {"Usage High", "You've used " + pct + " of your " + label + ".", urgency::NORMAL};
    case model::tier::WARNING:
      return {"Usage Warning", "You've reached " + pct + " of your " + label + ".", urgency::LOW};
    case model::tier::HEALTHY:
      break;
  }
  return {"Usage Update", label + " is at " + pct + ".", urgency::LOW};
}

Notification make_auth_notification(const model::error_kind kind) {
  if (kind == model::error_kind::AUTH_ERROR) {
    return {"Token Expired", "Re-authenticate by running 'claude' in terminal.", urgency::NORMAL};
  }
  return {"Authentication Required", "Run 'claude' in terminal first to authenticate.", urgency::NORMAL};
}

}  // namespace quota_watch::sinks
