#pragma once

#include <optional>

#include "model/usage_snapshot.hpp"

namespace quota_watch::core {

// Last successful observation. Never expires; staleness is reported through
// CurrentState instead of eviction.
class SnapshotCache {
 public:
  [[nodiscard]] const std::optional<model::UsageSnapshot>& get() const noexcept;

  [[nodiscard]] bool empty() const noexcept;

  void put(model::UsageSnapshot snapshot);

 private:
  std::optional<model::UsageSnapshot> snapshot_{};
};

}  // namespace quota_watch::core
