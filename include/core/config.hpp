#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "model/usage_snapshot.hpp"
#include "risk/tier_classifier.hpp"

namespace quota_watch::core {

struct ApiConfig {
  std::string url{"https://api.anthropic.com/api/oauth/usage"};
  std::string beta_header{"oauth-2025-04-20"};
  std::chrono::seconds timeout{10};
};

struct NotificationConfig {
  bool enabled{true};
  std::vector<model::tier> tiers{model::tier::DANGER, model::tier::CRITICAL};
  std::chrono::milliseconds timeout{10000};
};

struct MonitorConfig {
  std::chrono::seconds poll_interval{120};
  risk::TierThresholds thresholds{};
  NotificationConfig notifications{};
  std::string credentials_path{};
  ApiConfig api{};
  bool stdout_status{true};
};

std::string default_credentials_path();

MonitorConfig default_monitor_config();

MonitorConfig load_monitor_config(const std::string& path);

// Cross-field checks; throws std::runtime_error.
void validate_monitor_config(const MonitorConfig& config);

std::string format_config_settings(const MonitorConfig& config, const std::string& config_path);

}  // namespace quota_watch::core
