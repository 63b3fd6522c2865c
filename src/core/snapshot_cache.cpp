#include "core/snapshot_cache.hpp"

#include <utility>

namespace quota_watch::core {

const std::optional<model::UsageSnapshot>& SnapshotCache::get() const noexcept { return snapshot_; }

bool SnapshotCache::empty() const noexcept { return !snapshot_.has_value(); }

void SnapshotCache::put(model::UsageSnapshot snapshot) { snapshot_ = std::move(snapshot); }

}  // namespace quota_watch::core
