#include <chrono>
#include <csignal>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <utility>

#include <curl/curl.h>

#include "core/config.hpp"
#include "core/poller.hpp"
#include "core/timestamp.hpp"
#include "sinks/alert_dispatcher.hpp"
#include "sinks/notifier.hpp"
#include "sinks/status_view.hpp"
#include "sources/credential_source.hpp"
#include "sources/usage_client.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;
volatile std::sig_atomic_t g_refresh_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

void handle_refresh_signal(int /*signal*/) {
  g_refresh_requested = 1;
}

std::unique_ptr<quota_watch::sinks::Notifier> build_notifier(const quota_watch::core::NotificationConfig& config) {
  if (!config.enabled) {
    std::cerr << "[monitor] desktop notifications disabled; alerts go to the log\n";
    return quota_watch::sinks::make_log_notifier();
  }

  auto notifier = quota_watch::sinks::make_desktop_notifier("Claude Usage Monitor", config.timeout);
  if (notifier != nullptr && notifier->available()) {
    std::cerr << "[monitor] libnotify desktop notifications ready\n";
    return notifier;
  }

  std::cerr << "[monitor] libnotify unavailable; falling back to log notifications\n";
  return quota_watch::sinks::make_log_notifier();
}

}  // namespace

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);
  std::signal(SIGUSR1, handle_refresh_signal);

  const std::string config_path = argc > 1 ? argv[1] : "";

  quota_watch::core::MonitorConfig config = quota_watch::core::default_monitor_config();
  try {
    if (!config_path.empty()) {
      config = quota_watch::core::load_monitor_config(config_path);
    }
    quota_watch::core::validate_monitor_config(config);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << quota_watch::core::format_config_settings(config, config_path) << '\n';

  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    std::cerr << "[monitor] curl_global_init failed\n";
    return 1;
  }

  int exit_code = 0;
  try {
    quota_watch::sources::HttpUsageOptions http_options{};
    http_options.url = config.api.url;
    http_options.beta_header = config.api.beta_header;
    http_options.timeout = config.api.timeout;

    auto dispatcher = std::make_unique<quota_watch::sinks::AlertDispatcher>(
        config.notifications, config.thresholds, build_notifier(config.notifications));

    quota_watch::core::Poller poller{config, quota_watch::sources::make_file_credential_source(config.credentials_path),
                                     quota_watch::sources::make_http_usage_client(http_options),
                                     std::move(dispatcher)};
    const quota_watch::sinks::StdoutStatusSink status_sink{config.thresholds};

    poller.start();

    std::uint64_t rendered_cycle = 0;
    while (g_shutdown_requested == 0) {
      if (g_refresh_requested != 0) {
        g_refresh_requested = 0;
        std::cerr << "[monitor] manual refresh requested\n";
        poller.refresh_now();
      }

      const auto state = poller.current_state();
      if (config.stdout_status && state.cycle != rendered_cycle) {
        status_sink.publish(state, quota_watch::core::wall_clock_now());
        rendered_cycle = state.cycle;
      }

      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[monitor] shutdown signal received; exiting cleanly\n";
    poller.stop();
  } catch (const std::exception& ex) {
    std::cerr << "[monitor] fatal: " << ex.what() << '\n';
    exit_code = 1;
  }

  curl_global_cleanup();
  return exit_code;
}
