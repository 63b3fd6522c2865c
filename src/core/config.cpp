#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace quota_watch::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string to_lower(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

// '#' opens a comment at line start or after whitespace; elsewhere it is
// part of the value (URLs, paths).
std::string strip_comment(const std::string& line) {
  for (std::size_t i = 0; i < line.size(); ++i) {
    if (line[i] == '#' && (i == 0 || std::isspace(static_cast<unsigned char>(line[i - 1])) != 0)) {
      return line.substr(0, i);
    }
  }
  return line;
}

bool parse_bool(const std::string& value) {
  const std::string lower = to_lower(value);
  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

model::tier parse_tier(const std::string& value) {
  const std::string lower = to_lower(trim(value));
  if (lower == "warning") {
    return model::tier::WARNING;
  }
  if (lower == "danger") {
    return model::tier::DANGER;
  }
  if (lower == "critical") {
    return model::tier::CRITICAL;
  }
  throw std::runtime_error("notifications.tiers entries must be warning, danger or critical: " + value);
}

std::vector<model::tier> parse_tier_list(const std::string& value) {
  std::vector<model::tier> tiers;
  std::string list = value;
  if (list.size() >= 2 && list.front() == '[' && list.back() == ']') {
    list = list.substr(1, list.size() - 2);
  }

  std::istringstream input(list);
  std::string item;
  while (std::getline(input, item, ',')) {
    if (trim(item).empty()) {
      continue;
    }
    const auto parsed = parse_tier(unquote(trim(item)));
    if (std::find(tiers.begin(), tiers.end(), parsed) == tiers.end()) {
      tiers.push_back(parsed);
    }
  }
  return tiers;
}

double parse_threshold(const std::string& key, const std::string& value) {
  const double parsed = std::stod(value);
  if (!(parsed > 0.0) || parsed > 1.0) {
    throw std::runtime_error(key + " must be a fraction in (0, 1]");
  }
  return parsed;
}

void apply_key_value(MonitorConfig& config, const std::string& key, const std::string& raw_value) {
  const std::string value = unquote(raw_value);

  if (key == "poll_interval_s") {
    const auto seconds = std::stoll(value);
    if (seconds <= 0) {
      throw std::runtime_error("poll_interval_s must be greater than 0");
    }
    if (seconds > 86400) {
      throw std::runtime_error("poll_interval_s must be less than or equal to 86400");
    }
    config.poll_interval = std::chrono::seconds(seconds);
    return;
  }

  if (key == "thresholds.warning") {
    config.thresholds.warning = parse_threshold(key, value);
    return;
  }

  if (key == "thresholds.danger") {
    config.thresholds.danger = parse_threshold(key, value);
    return;
  }

  if (key == "thresholds.critical") {
    config.thresholds.critical = parse_threshold(key, value);
    return;
  }

  if (key == "notifications.enabled") {
    config.notifications.enabled = parse_bool(value);
    return;
  }

  if (key == "notifications.tiers") {
    config.notifications.tiers = parse_tier_list(value);
    return;
  }

  if (key == "notifications.timeout_ms") {
    const auto timeout_ms = std::stoll(value);
    if (timeout_ms < 0) {
      throw std::runtime_error("notifications.timeout_ms must be greater than or equal to 0");
    }
    config.notifications.timeout = std::chrono::milliseconds(timeout_ms);
    return;
  }

  if (key == "credentials.path") {
    config.credentials_path = value;
    return;
  }

  if (key == "api.url") {
    if (value.rfind("https://", 0) != 0 && value.rfind("http://", 0) != 0) {
      throw std::runtime_error("api.url must be an http(s) URL");
    }
    config.api.url = value;
    return;
  }

  if (key == "api.beta_header") {
    config.api.beta_header = value;
    return;
  }

  if (key == "api.timeout_s") {
    const auto seconds = std::stoll(value);
    if (seconds <= 0 || seconds > 300) {
      throw std::runtime_error("api.timeout_s must be in range 1..300");
    }
    config.api.timeout = std::chrono::seconds(seconds);
    return;
  }

  if (key == "agent.stdout_status") {
    config.stdout_status = parse_bool(value);
    return;
  }

  throw std::runtime_error("unknown config key: " + key);
}

}  // namespace

std::string default_credentials_path() {
  const char* home = std::getenv("HOME");
  const std::string base = home != nullptr && *home != '\0' ? home : ".";
  return base + "/.claude/.credentials.json";
}

MonitorConfig default_monitor_config() {
  MonitorConfig config{};
  config.credentials_path = default_credentials_path();
  return config;
}

MonitorConfig load_monitor_config(const std::string& path) {
  MonitorConfig config = default_monitor_config();

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    line = strip_comment(line);

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  validate_monitor_config(config);
  return config;
}

void validate_monitor_config(const MonitorConfig& config) {
  if (config.poll_interval.count() <= 0) {
    throw std::runtime_error("poll interval must be greater than 0");
  }

  const auto& t = config.thresholds;
  if (!(t.warning > 0.0) || t.critical > 1.0) {
    throw std::runtime_error("thresholds must be fractions in (0, 1]");
  }
  if (!(t.warning < t.danger && t.danger < t.critical)) {
    throw std::runtime_error("thresholds must be strictly ascending: warning < danger < critical");
  }

  if (config.api.url.empty()) {
    throw std::runtime_error("api.url must not be empty");
  }
}

std::string format_config_settings(const MonitorConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[monitor] loaded config from " << (config_path.empty() ? "<defaults>" : config_path)
         << " | poll_interval_s=" << config.poll_interval.count()
         << " | thresholds=" << config.thresholds.warning << '/' << config.thresholds.danger << '/'
         << config.thresholds.critical
         << " | notifications_enabled=" << (config.notifications.enabled ? "true" : "false")
         << " | notification_tiers=";

  for (std::size_t i = 0; i < config.notifications.tiers.size(); ++i) {
    output << (i == 0 ? "" : ",") << model::to_string(config.notifications.tiers[i]);
  }

  output << " | credentials_path=" << config.credentials_path
         << " | api_url=" << config.api.url
         << " | api_timeout_s=" << config.api.timeout.count()
         << " | stdout_status=" << (config.stdout_status ? "true" : "false");
  return output.str();
}

}  // namespace quota_watch::core
