#pragma once

#include <string>
#include <vector>

#include "model/usage_snapshot.hpp"
#include "risk/tier_classifier.hpp"

namespace quota_watch::sinks {

// Tier dot and five-hour percentage, e.g. "🟠 88%".
std::string compact_label(const model::CurrentState& state, const risk::TierThresholds& thresholds = {});

std::vector<std::string> detail_lines(const model::CurrentState& state, model::Timestamp now);

class StdoutStatusSink {
 public:
  explicit StdoutStatusSink(risk::TierThresholds thresholds = {}) : thresholds_(thresholds) {}

  void publish(const model::CurrentState& state, model::Timestamp now) const;

 private:
  risk::TierThresholds thresholds_;
};

}  // namespace quota_watch::sinks
