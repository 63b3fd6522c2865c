#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "model/usage_snapshot.hpp"

namespace quota_watch::sources {

class UsageClient {
 public:
  // One network call. Throws FetchError(NETWORK_ERROR | AUTH_ERROR | MALFORMED_RESPONSE).
  virtual model::UsageSnapshot fetch_usage(const std::string& token) = 0;
  virtual ~UsageClient() = default;
};

struct HttpUsageOptions {
  std::string url{"https://api.anthropic.com/api/oauth/usage"};
  std::string beta_header{"oauth-2025-04-20"};
  std::chrono::seconds timeout{10};
};

// Maps a usage response body onto a snapshot captured at `captured_at`.
// Throws FetchError(MALFORMED_RESPONSE) naming the offending field.
model::UsageSnapshot parse_usage_response(const std::string& body, model::Timestamp captured_at);

// Failure kind for a completed HTTP exchange with a non-2xx status.
model::error_kind classify_http_status(long http_code) noexcept;

std::unique_ptr<UsageClient> make_http_usage_client(HttpUsageOptions options);

}  // namespace quota_watch::sources
