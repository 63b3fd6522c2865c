#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "core/config.hpp"
#include "core/timestamp.hpp"
#include "model/usage_snapshot.hpp"
#include "sinks/status_view.hpp"
#include "sources/credential_source.hpp"
#include "sources/fetch_error.hpp"
#include "sources/usage_client.hpp"

using quota_watch::core::format_reset_in;
using quota_watch::core::load_monitor_config;
using quota_watch::core::parse_iso8601;
using quota_watch::model::Clock;
using quota_watch::model::CurrentState;
using quota_watch::model::error_kind;
using quota_watch::model::freshness;
using quota_watch::model::tier;
using quota_watch::model::Timestamp;
using quota_watch::model::UsageSnapshot;
using quota_watch::sinks::compact_label;
using quota_watch::sinks::detail_lines;
using quota_watch::sources::classify_http_status;
using quota_watch::sources::FetchError;
using quota_watch::sources::HttpUsageOptions;
using quota_watch::sources::make_file_credential_source;
using quota_watch::sources::make_http_usage_client;
using quota_watch::sources::parse_credentials_token;
using quota_watch::sources::parse_usage_response;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

bool write_file(const std::filesystem::path& path, const std::string& content) {
  std::ofstream output(path, std::ios::trunc);
  if (!output.is_open()) {
    return false;
  }
  output << content;
  return output.good();
}

bool malformed(const std::string& body) {
  try {
    (void)parse_usage_response(body, Clock::now());
  } catch (const FetchError& ex) {
    return ex.kind() == error_kind::MALFORMED_RESPONSE;
  }
  return false;
}

int test_parse_usage_response_reads_both_windows() {
  const std::string body = R"({
    "five_hour": {"utilization": 88.0, "resets_at": "2025-11-04T18:00:00.123456+00:00"},
    "seven_day": {"utilization": 12, "resets_at": "2025-11-08T09:30:00Z"},
    "seven_day_opus": null
  })";
  const Timestamp captured = Clock::now();

  const UsageSnapshot snapshot = parse_usage_response(body, captured);
  if (snapshot.five_hour_percent != 88.0 || snapshot.weekly_percent != 12.0) {
    return fail("test_parse_usage_response_reads_both_windows", "utilization mismatch");
  }
  if (!snapshot.five_hour_reset_at.has_value() || !snapshot.weekly_reset_at.has_value()) {
    return fail("test_parse_usage_response_reads_both_windows", "reset times must be parsed");
  }
  if (snapshot.captured_at != captured) {
    return fail("test_parse_usage_response_reads_both_windows", "captured_at must be the supplied time");
  }

  const auto expected_weekly = parse_iso8601("2025-11-08T09:30:00+00:00");
  if (!expected_weekly.has_value() || *snapshot.weekly_reset_at != *expected_weekly) {
    return fail("test_parse_usage_response_reads_both_windows", "Z and +00:00 must be the same instant");
  }

  return 0;
}

int test_parse_usage_response_null_fields_default() {
  const UsageSnapshot snapshot =
      parse_usage_response(R"({"five_hour": {"utilization": null, "resets_at": null}, "seven_day": null})", Clock::now());
  if (snapshot.five_hour_percent != 0.0 || snapshot.weekly_percent != 0.0 || snapshot.five_hour_reset_at.has_value() ||
      snapshot.weekly_reset_at.has_value()) {
    return fail("test_parse_usage_response_null_fields_default", "null windows must read as 0% with no reset");
  }

  return 0;
}

int test_parse_usage_response_rejects_bad_payloads() {
  const std::vector<std::string> bodies = {
      "not json",
      "[1, 2, 3]",
      R"({"unrelated": true})",
      R"({"five_hour": {"utilization": "high"}})",
      R"({"five_hour": {"utilization": 101.5}})",
      R"({"seven_day": {"utilization": -1}})",
      R"({"five_hour": {"utilization": 10, "resets_at": "tomorrow"}})",
      R"({"five_hour": {"utilization": 10, "resets_at": 12345}})",
      R"({"five_hour": 42})",
  };

  for (const auto& body : bodies) {
    if (!malformed(body)) {
      std::cerr << "  body: " << body << '\n';
      return fail("test_parse_usage_response_rejects_bad_payloads", "payload should be malformed");
    }
  }

  return 0;
}

int test_http_status_classification() {
  if (classify_http_status(401) != error_kind::AUTH_ERROR || classify_http_status(403) != error_kind::AUTH_ERROR) {
    return fail("test_http_status_classification", "401/403 must be auth errors");
  }
  if (classify_http_status(500) != error_kind::NETWORK_ERROR || classify_http_status(429) != error_kind::NETWORK_ERROR ||
      classify_http_status(404) != error_kind::NETWORK_ERROR) {
    return fail("test_http_status_classification", "other statuses must be network errors");
  }

  return 0;
}

int test_iso8601_parsing() {
  const auto base = parse_iso8601("2025-01-01T00:00:00Z");
  const auto offset = parse_iso8601("2025-01-01T02:00:00+02:00");
  const auto negative = parse_iso8601("2024-12-31T19:00:00-05:00");
  if (!base.has_value() || !offset.has_value() || !negative.has_value()) {
    return fail("test_iso8601_parsing", "valid timestamps must parse");
  }
  if (*base != *offset || *base != *negative) {
    return fail("test_iso8601_parsing", "offsets must normalise to the same instant");
  }
  if (Clock::to_time_t(*base) != 1735689600) {
    return fail("test_iso8601_parsing", "epoch seconds mismatch");
  }

  const auto fractional = parse_iso8601("2025-01-01T00:00:00.5Z");
  if (!fractional.has_value() || *fractional - *base != std::chrono::milliseconds(500)) {
    return fail("test_iso8601_parsing", "fractional seconds mismatch");
  }

  for (const char* bad : {"", "2025-01-01", "2025-13-01T00:00:00Z", "2025-01-01T00:00:00Q", "2025-01-01T00:00:00+0200"}) {
    if (parse_iso8601(bad).has_value()) {
      return fail("test_iso8601_parsing", "invalid timestamp accepted");
    }
  }

  return 0;
}

int test_reset_formatting() {
  const Timestamp now = Clock::now();
  if (format_reset_in(now - std::chrono::minutes(1), now) != "soon") {
    return fail("test_reset_formatting", "past reset should read soon");
  }
  if (format_reset_in(now + std::chrono::minutes(42) + std::chrono::seconds(5), now) != "in 42m") {
    return fail("test_reset_formatting", "minutes formatting mismatch");
  }
  if (format_reset_in(now + std::chrono::hours(2) + std::chrono::minutes(3), now) != "in 2h 3m") {
    return fail("test_reset_formatting", "hours formatting mismatch");
  }
  if (format_reset_in(now + std::chrono::hours(80), now) != "in 3d") {
    return fail("test_reset_formatting", "days formatting mismatch");
  }

  return 0;
}

int test_credentials_token_extraction() {
  if (parse_credentials_token(R"({"claudeAiOauth": {"accessToken": "sk-ant-oat01-abc", "expiresAt": 1}})") !=
      "sk-ant-oat01-abc") {
    return fail("test_credentials_token_extraction", "token mismatch");
  }

  for (const char* bad : {"{", R"({"other": {}})", R"({"claudeAiOauth": {"accessToken": ""}})",
                          R"({"claudeAiOauth": {"refreshToken": "x"}})"}) {
    bool threw = false;
    try {
      (void)parse_credentials_token(bad);
    } catch (const FetchError& ex) {
      threw = ex.kind() == error_kind::NOT_AUTHENTICATED;
    }
    if (!threw) {
      return fail("test_credentials_token_extraction", "bad credential document must be not_authenticated");
    }
  }

  return 0;
}

int test_file_credential_source_caches_until_invalidated() {
  const auto path = std::filesystem::temp_directory_path() / "quota_watch_credentials.json";
  std::filesystem::remove(path);

  auto source = make_file_credential_source(path.string());
  bool missing_threw = false;
  try {
    (void)source->get_token();
  } catch (const FetchError& ex) {
    missing_threw = ex.kind() == error_kind::NOT_AUTHENTICATED;
  }
  if (!missing_threw) {
    return fail("test_file_credential_source_caches_until_invalidated", "missing file must be not_authenticated");
  }

  if (!write_file(path, R"({"claudeAiOauth": {"accessToken": "first"}})")) {
    return fail("test_file_credential_source_caches_until_invalidated", "failed writing credentials");
  }
  if (source->get_token() != "first") {
    return fail("test_file_credential_source_caches_until_invalidated", "first token mismatch");
  }

  if (!write_file(path, R"({"claudeAiOauth": {"accessToken": "second"}})")) {
    return fail("test_file_credential_source_caches_until_invalidated", "failed rewriting credentials");
  }
  if (source->get_token() != "first") {
    return fail("test_file_credential_source_caches_until_invalidated", "token must be cached");
  }

  source->invalidate();
  if (source->get_token() != "second") {
    return fail("test_file_credential_source_caches_until_invalidated", "invalidate must force a re-read");
  }

  std::filesystem::remove(path);
  return 0;
}

int test_config_loading_and_validation() {
  const auto good = std::filesystem::temp_directory_path() / "quota_watch_good.yaml";
  const bool wrote = write_file(good,
                                "poll_interval_s: 60  # once a minute\n"
                                "thresholds:\n"
                                "  warning: 0.5\n"
                                "  danger: 0.8\n"
                                "  critical: 0.9\n"
                                "notifications:\n"
                                "  enabled: false\n"
                                "  tiers: [warning, critical]\n"
                                "credentials:\n"
                                "  path: \"/tmp/creds.json\"\n"
                                "api:\n"
                                "  url: https://example.test/usage\n"
                                "  timeout_s: 5\n"
                                "agent:\n"
                                "  stdout_status: off\n");
  if (!wrote) {
    return fail("test_config_loading_and_validation", "failed writing config");
  }

  const auto config = load_monitor_config(good.string());
  if (config.poll_interval != std::chrono::seconds(60) || config.thresholds.warning != 0.5 ||
      config.thresholds.danger != 0.8 || config.thresholds.critical != 0.9) {
    return fail("test_config_loading_and_validation", "interval/threshold mismatch");
  }
  if (config.notifications.enabled || config.notifications.tiers != std::vector<tier>{tier::WARNING, tier::CRITICAL}) {
    return fail("test_config_loading_and_validation", "notification settings mismatch");
  }
  if (config.credentials_path != "/tmp/creds.json" || config.api.url != "https://example.test/usage" ||
      config.api.timeout != std::chrono::seconds(5) || config.stdout_status) {
    return fail("test_config_loading_and_validation", "credentials/api/agent settings mismatch");
  }
  std::filesystem::remove(good);

  const std::vector<std::string> bad_configs = {
      "poll_interval_s: 0\n",
      "poll_interval_s: soon\n",
      "thresholds:\n  warning: 1.5\n",
      "thresholds:\n  danger: 0.6\n",
      "notifications:\n  tiers: warning, severe\n",
      "api:\n  url: ftp://example.test\n",
      "api:\n  timeout_s: 0\n",
      "mystery_key: 1\n",
  };

  const auto bad = std::filesystem::temp_directory_path() / "quota_watch_bad.yaml";
  for (const auto& content : bad_configs) {
    if (!write_file(bad, content)) {
      return fail("test_config_loading_and_validation", "failed writing bad config");
    }
    bool threw = false;
    try {
      (void)load_monitor_config(bad.string());
    } catch (const std::exception&) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "  config: " << content;
      return fail("test_config_loading_and_validation", "invalid config must throw");
    }
  }
  std::filesystem::remove(bad);

  bool missing_threw = false;
  try {
    (void)load_monitor_config("/nonexistent/quota_watch.yaml");
  } catch (const std::runtime_error&) {
    missing_threw = true;
  }
  if (!missing_threw) {
    return fail("test_config_loading_and_validation", "missing config file must throw");
  }

  return 0;
}

int test_config_keeps_hash_inside_values() {
  const auto path = std::filesystem::temp_directory_path() / "quota_watch_hash.yaml";
  const bool wrote = write_file(path,
                                "# quota-watch settings\n"
                                "credentials:\n"
                                "  path: /tmp/team#2/creds.json   # shared box\n"
                                "api:\n"
                                "  url: https://example.test/usage#v2\n"
                                "  beta_header: oauth#beta\t# tab before comment\n");
  if (!wrote) {
    return fail("test_config_keeps_hash_inside_values", "failed writing config");
  }

  const auto config = load_monitor_config(path.string());
  std::filesystem::remove(path);
  if (config.credentials_path != "/tmp/team#2/creds.json") {
    return fail("test_config_keeps_hash_inside_values", "credentials.path truncated at '#'");
  }
  if (config.api.url != "https://example.test/usage#v2") {
    return fail("test_config_keeps_hash_inside_values", "api.url truncated at '#'");
  }
  if (config.api.beta_header != "oauth#beta") {
    return fail("test_config_keeps_hash_inside_values", "comment after a tab must be stripped");
  }

  return 0;
}

// Serves a 302 pointing at a plain-http URL on the same listener and counts
// connections until it has been idle for a second.
int test_http_client_refuses_plain_http_redirect() {
  for (const char* name : {"http_proxy", "HTTP_PROXY", "all_proxy", "ALL_PROXY"}) {
    ::unsetenv(name);
  }

  const int listener = ::socket(AF_INET, SOCK_STREAM, 0);
  if (listener < 0) {
    return fail("test_http_client_refuses_plain_http_redirect", "socket failed");
  }
  sockaddr_in address{};
  address.sin_family = AF_INET;
  address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  address.sin_port = 0;
  socklen_t length = sizeof(address);
  if (::bind(listener, reinterpret_cast<sockaddr*>(&address), sizeof(address)) != 0 || ::listen(listener, 8) != 0 ||
      ::getsockname(listener, reinterpret_cast<sockaddr*>(&address), &length) != 0) {
    ::close(listener);
    return fail("test_http_client_refuses_plain_http_redirect", "unable to listen on loopback");
  }
  const std::string base = "http://127.0.0.1:" + std::to_string(ntohs(address.sin_port));

  std::atomic<int> accepted{0};
  std::thread server([&]() {
    pollfd pending{listener, POLLIN, 0};
    while (::poll(&pending, 1, 1000) > 0) {
      const int client = ::accept(listener, nullptr, nullptr);
      if (client < 0) {
        break;
      }
      ++accepted;
      char request[4096];
      (void)::recv(client, request, sizeof(request), 0);
      const std::string response = "HTTP/1.1 302 Found\r\nLocation: " + base +
                                   "/followed\r\nContent-Length: 0\r\nConnection: close\r\n\r\n";
      (void)::send(client, response.data(), response.size(), MSG_NOSIGNAL);
      ::close(client);
    }
  });

  HttpUsageOptions options{};
  options.url = base + "/usage";
  options.timeout = std::chrono::seconds(5);
  auto client = make_http_usage_client(options);

  bool network_error = false;
  try {
    (void)client->fetch_usage("token");
  } catch (const FetchError& ex) {
    network_error = ex.kind() == error_kind::NETWORK_ERROR;
  }
  server.join();
  ::close(listener);

  if (!network_error) {
    return fail("test_http_client_refuses_plain_http_redirect", "redirect to http must fail as network_error");
  }
  if (accepted.load() != 1) {
    return fail("test_http_client_refuses_plain_http_redirect", "redirect must not be followed");
  }

  return 0;
}

int test_status_view_labels() {
  CurrentState state{};
  if (compact_label(state) != "⏳") {
    return fail("test_status_view_labels", "initial label must be the pending glyph");
  }

  state.last_error = error_kind::NETWORK_ERROR;
  state.last_checked_at = Clock::now();
  if (compact_label(state) != "⚠️") {
    return fail("test_status_view_labels", "unavailable after failure must warn");
  }

  UsageSnapshot snapshot{};
  snapshot.five_hour_percent = 88.0;
  snapshot.weekly_percent = 12.0;
  snapshot.five_hour_reset_at = Clock::now() + std::chrono::hours(2) + std::chrono::minutes(3) + std::chrono::seconds(30);
  snapshot.captured_at = Clock::now();

  state.snapshot = snapshot;
  state.fresh = freshness::LIVE;
  state.last_error.reset();
  if (compact_label(state) != "🟠 88%") {
    return fail("test_status_view_labels", "danger label mismatch");
  }

  state.fresh = freshness::STALE;
  state.last_error = error_kind::NETWORK_ERROR;
  if (compact_label(state) != "🟠 88% (stale)") {
    return fail("test_status_view_labels", "stale label mismatch");
  }

  const auto lines = detail_lines(state, Clock::now());
  if (lines.size() < 4 || lines[0] != "5h: 88% used • resets in 2h 3m" || lines[1] != "Weekly: 12% used • resets unknown") {
    return fail("test_status_view_labels", "detail lines mismatch");
  }
  if (lines[3].find("last known usage") == std::string::npos) {
    return fail("test_status_view_labels", "stale status line missing");
  }

  state.last_error = error_kind::AUTH_ERROR;
  if (compact_label(state) != "🔑") {
    return fail("test_status_view_labels", "auth failures must show the authenticate indicator");
  }

  return 0;
}

}  // namespace

int main() {
  if (int rc = test_parse_usage_response_reads_both_windows(); rc != 0) return rc;
  if (int rc = test_parse_usage_response_null_fields_default(); rc != 0) return rc;
  if (int rc = test_parse_usage_response_rejects_bad_payloads(); rc != 0) return rc;
  if (int rc = test_http_status_classification(); rc != 0) return rc;
  if (int rc = test_iso8601_parsing(); rc != 0) return rc;
  if (int rc = test_reset_formatting(); rc != 0) return rc;
  if (int rc = test_credentials_token_extraction(); rc != 0) return rc;
  if (int rc = test_file_credential_source_caches_until_invalidated(); rc != 0) return rc;
  if (int rc = test_config_loading_and_validation(); rc != 0) return rc;
  if (int rc = test_config_keeps_hash_inside_values(); rc != 0) return rc;
  if (int rc = test_http_client_refuses_plain_http_redirect(); rc != 0) return rc;
  if (int rc = test_status_view_labels(); rc != 0) return rc;

  std::cout << "[PASS] sources unit tests\n";
  return 0;
}
