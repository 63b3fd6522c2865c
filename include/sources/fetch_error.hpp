#pragma once

#include <stdexcept>
#include <string>

#include "model/usage_snapshot.hpp"

namespace quota_watch::sources {

// Thrown by credential sources and usage clients; the poller maps it onto
// CurrentState.last_error.
class FetchError : public std::runtime_error {
 public:
  FetchError(model::error_kind kind, const std::string& message) : std::runtime_error(message), kind_(kind) {}

  [[nodiscard]] model::error_kind kind() const noexcept { return kind_; }

 private:
  model::error_kind kind_;
};

}  // namespace quota_watch::sources
