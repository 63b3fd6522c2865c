#include "sources/usage_client.hpp"

#include <cmath>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include "core/timestamp.hpp"
#include "sources/fetch_error.hpp"

namespace quota_watch::sources {
namespace {

struct CurlDeleter {
  void operator()(CURL* handle) const {
    if (handle != nullptr) {
      curl_easy_cleanup(handle);
    }
  }
};

struct HeaderListDeleter {
  void operator()(curl_slist* headers) const {
    if (headers != nullptr) {
      curl_slist_free_all(headers);
    }
  }
};

std::size_t write_body(void* contents, std::size_t size, std::size_t nmemb, void* userp) {
  const std::size_t total_size = size * nmemb;
  static_cast<std::string*>(userp)->append(static_cast<const char*>(contents), total_size);
  return total_size;
}

FetchError malformed(const std::string& message) {
  return FetchError(model::error_kind::MALFORMED_RESPONSE, message);
}

double read_utilization(const nlohmann::json& window, const char* name) {
  const auto it = window.find("utilization");
  if (it == window.end() || it->is_null()) {
    return 0.0;
  }
  if (!it->is_number()) {
    throw malformed(std::string(name) + ".utilization is not a number");
  }

  const double value = it->get<double>();
  if (!std::isfinite(value) || value < 0.0 || value > 100.0) {
    throw malformed(std::string(name) + ".utilization out of range: " + it->dump());
  }
  return value;
}

std::optional<model::Timestamp> read_reset_at(const nlohmann::json& window, const char* name) {
  const auto it = window.find("resets_at");
  if (it == window.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_string()) {
    throw malformed(std::string(name) + ".resets_at is not a string");
  }

  const auto parsed = core::parse_iso8601(it->get<std::string>());
  if (!parsed.has_value()) {
    throw malformed(std::string(name) + ".resets_at is not an ISO-8601 timestamp: " + it->get<std::string>());
  }
  return parsed;
}

const nlohmann::json& read_window(const nlohmann::json& document, const char* name) {
  static const nlohmann::json kEmptyWindow = nlohmann::json::object();

  const auto it = document.find(name);
  if (it == document.end() || it->is_null()) {
    return kEmptyWindow;
  }
  if (!it->is_object()) {
    throw malformed(std::string(name) + " is not an object");
  }
  return *it;
}

class HttpUsageClient final : public UsageClient {
 public:
  explicit HttpUsageClient(HttpUsageOptions options) : options_(std::move(options)) {}

  model::UsageSnapshot fetch_usage(const std::string& token) override {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (curl == nullptr) {
      throw FetchError(model::error_kind::NETWORK_ERROR, "curl_easy_init failed");
    }

    const std::string auth_header = "Authorization: Bearer " + token;
    const std::string beta_header = "anthropic-beta: " + options_.beta_header;

    curl_slist* raw_headers = curl_slist_append(nullptr, auth_header.c_str());
    raw_headers = raw_headers != nullptr ? curl_slist_append(raw_headers, beta_header.c_str()) : nullptr;
    raw_headers = raw_headers != nullptr ? curl_slist_append(raw_headers, "Accept: application/json") : nullptr;
    std::unique_ptr<curl_slist, HeaderListDeleter> headers(raw_headers);
    if (headers == nullptr) {
      throw FetchError(model::error_kind::NETWORK_ERROR, "unable to build request headers");
    }

    std::string body;
    char errbuf[CURL_ERROR_SIZE];
    errbuf[0] = '\0';

    curl_easy_setopt(curl.get(), CURLOPT_URL, options_.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl.get(), CURLOPT_REDIR_PROTOCOLS_STR, "https");
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(options_.timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);

    const CURLcode code = curl_easy_perform(curl.get());
    if (code != CURLE_OK) {
      const std::string detail = errbuf[0] != '\0' ? errbuf : curl_easy_strerror(code);
      throw FetchError(model::error_kind::NETWORK_ERROR, "request failed: " + detail);
    }

    long http_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code < 200 || http_code >= 300) {
      throw FetchError(classify_http_status(http_code), "HTTP " + std::to_string(http_code));
    }

    return parse_usage_response(body, core::wall_clock_now());
  }

 private:
  HttpUsageOptions options_;
};

}  // namespace

model::error_kind classify_http_status(const long http_code) noexcept {
  if (http_code == 401 || http_code == 403) {
    return model::error_kind::AUTH_ERROR;
  }
  return model::error_kind::NETWORK_ERROR;
}

model::UsageSnapshot parse_usage_response(const std::string& body, const model::Timestamp captured_at) {
  const auto document = nlohmann::json::parse(body, nullptr, false);
  if (document.is_discarded()) {
    throw malformed("response body is not valid JSON");
  }
  if (!document.is_object()) {
    throw malformed("response body is not a JSON object");
  }

  if (!document.contains("five_hour") && !document.contains("seven_day")) {
    throw malformed("response carries neither five_hour nor seven_day");
  }

  const auto& five_hour = read_window(document, "five_hour");
  const auto& weekly = read_window(document, "seven_day");

  model::UsageSnapshot snapshot{};
  snapshot.five_hour_percent = read_utilization(five_hour, "five_hour");
  snapshot.weekly_percent = read_utilization(weekly, "seven_day");
  snapshot.five_hour_reset_at = read_reset_at(five_hour, "five_hour");
  snapshot.weekly_reset_at = read_reset_at(weekly, "seven_day");
  snapshot.captured_at = captured_at;
  return snapshot;
}

std::unique_ptr<UsageClient> make_http_usage_client(HttpUsageOptions options) {
  return std::make_unique<HttpUsageClient>(std::move(options));
}

}  // namespace quota_watch::sources
