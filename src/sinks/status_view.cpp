#include "sinks/status_view.hpp"

#include <cmath>
#include <cstdio>

#include "core/timestamp.hpp"

namespace quota_watch::sinks {
namespace {

const char* tier_glyph(const model::tier level) {
  switch (level) {
    case model::tier::CRITICAL:
      return "🔴";
    case model::tier::DANGER:
      return "🟠";
    case model::tier::WARNING:
      return "🟡";
    case model::tier::HEALTHY:
      break;
  }
  return "🟢";
}

std::string whole_percent(const double percent) { return std::to_string(std::lround(percent)) + "%"; }

std::string window_line(const char* label, const double percent, const std::optional<model::Timestamp>& reset_at,
                        const model::Timestamp now) {
  const std::string reset = reset_at.has_value() ? core::format_reset_in(*reset_at, now) : "unknown";
  return std::string(label) + ": " + whole_percent(percent) + " used • resets " + reset;
}

}  // namespace

std::string compact_label(const model::CurrentState& state, const risk::TierThresholds& thresholds) {
  if (state.last_error.has_value() && model::is_auth_failure(*state.last_error)) {
    return "🔑";
  }

  if (!state.snapshot.has_value()) {
    return state.last_error.has_value() ? "⚠️" : "⏳";
  }

  std::string label = std::string(tier_glyph(risk::peak_tier(*state.snapshot, thresholds))) + " " +
                      whole_percent(state.snapshot->five_hour_percent);
  if (state.fresh == model::freshness::STALE) {
    label += " (stale)";
  }
  return label;
}

std::vector<std::string> detail_lines(const model::CurrentState& state, const model::Timestamp now) {
  std::vector<std::string> lines;

  if (state.snapshot.has_value()) {
    const auto& snapshot = *state.snapshot;
    lines.push_back(window_line("5h", snapshot.five_hour_percent, snapshot.five_hour_reset_at, now));
    lines.push_back(window_line("Weekly", snapshot.weekly_percent, snapshot.weekly_reset_at, now));
    lines.push_back("Updated: " + core::format_local_clock(snapshot.captured_at));
  } else {
    lines.emplace_back("5h Limit: --");
    lines.emplace_back("Weekly: --");
    lines.emplace_back("Updated: --");
  }

  if (state.last_error.has_value()) {
    const auto kind = *state.last_error;
    if (kind == model::error_kind::NOT_AUTHENTICATED) {
      lines.emplace_back("Status: authentication required, run 'claude' to sign in");
    } else if (kind == model::error_kind::AUTH_ERROR) {
      lines.emplace_back("Status: token rejected, run 'claude' to sign in again");
    } else if (state.fresh == model::freshness::STALE) {
      lines.push_back(std::string("Status: showing last known usage (") + model::to_string(kind) + ")");
    } else {
      lines.push_back(std::string("Status: usage unavailable (") + model::to_string(kind) + ")");
    }
  }

  if (state.last_checked_at.has_value()) {
    lines.push_back("Checked: " + core::format_local_clock(*state.last_checked_at));
  }

  return lines;
}

void StdoutStatusSink::publish(const model::CurrentState& state, const model::Timestamp now) const {
  std::printf("[status] %s\n", compact_label(state, thresholds_).c_str());
  for (const auto& line : detail_lines(state, now)) {
    std::printf("  %s\n", line.c_str());
  }
  std::fflush(stdout);
}

}  // namespace quota_watch::sinks
