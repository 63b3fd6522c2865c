#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "model/usage_snapshot.hpp"

namespace quota_watch::core {

inline model::Timestamp wall_clock_now() { return model::Clock::now(); }

inline std::uint64_t unix_timestamp_ms(const model::Timestamp at) {
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(at.time_since_epoch()).count());
}

// Accepts "YYYY-MM-DDTHH:MM:SS" followed by optional fractional seconds and
// a "Z" or "+HH:MM"/"-HH:MM" offset. Returns nullopt on anything else.
std::optional<model::Timestamp> parse_iso8601(const std::string& text);

// Local wall-clock "HH:MM".
std::string format_local_clock(model::Timestamp at);

// "soon", "in 3d", "in 2h 5m", "in 12m" relative to now.
std::string format_reset_in(model::Timestamp reset_at, model::Timestamp now);

}  // namespace quota_watch::core
