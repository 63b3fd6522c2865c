#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "core/config.hpp"
#include "core/snapshot_cache.hpp"
#include "model/usage_snapshot.hpp"
#include "sinks/alert_dispatcher.hpp"
#include "sources/credential_source.hpp"
#include "sources/usage_client.hpp"

namespace quota_watch::core {

struct PollerStats {
  std::size_t cycles_run{0};
  std::size_t cycles_joined{0};
  std::size_t successes{0};
  std::size_t failures{0};
  std::size_t notifications{0};
};

// Drives credential -> usage fetch -> cache -> crossings on a fixed period and
// publishes one CurrentState per cycle.
//
// At most one cycle runs at a time. A poll_once() issued while a cycle is in
// flight waits for that cycle and returns its state instead of starting a
// second fetch. Cache and cycle bookkeeping are touched only by the cycle
// owner; the published state is swapped in whole under state_mutex_.
class Poller {
 public:
  Poller(MonitorConfig config, std::unique_ptr<sources::CredentialSource> credentials,
         std::unique_ptr<sources::UsageClient> client, std::unique_ptr<sinks::AlertDispatcher> dispatcher);
  ~Poller();

  Poller(const Poller&) = delete;
  Poller& operator=(const Poller&) = delete;

  // First cycle fires immediately. Throws std::invalid_argument for a
  // non-positive interval. A second start() while running is a no-op.
  void start();
  void start(std::chrono::milliseconds interval);
  void stop();
  [[nodiscard]] bool running() const;

  model::CurrentState poll_once();
  model::CurrentState refresh_now();

  [[nodiscard]] model::CurrentState current_state() const;
  [[nodiscard]] PollerStats stats() const;

 private:
  struct CycleTally {
    bool succeeded{false};
    std::size_t notifications{0};
  };

  void run_loop(std::chrono::milliseconds interval);
  model::CurrentState run_cycle(CycleTally& tally);
  void log_outcome(const model::CurrentState& state);

  MonitorConfig config_;
  std::unique_ptr<sources::CredentialSource> credentials_;
  std::unique_ptr<sources::UsageClient> client_;
  std::unique_ptr<sinks::AlertDispatcher> dispatcher_;

  // Owned by the in-flight cycle.
  SnapshotCache cache_{};
  std::uint64_t cycles_completed_{0};
  std::optional<model::error_kind> last_logged_error_{};

  mutable std::mutex state_mutex_;
  std::condition_variable cycle_done_;
  bool in_flight_{false};
  std::uint64_t generation_{0};
  model::CurrentState published_{};
  PollerStats stats_{};

  mutable std::mutex timer_mutex_;
  std::condition_variable timer_wakeup_;
  bool stop_requested_{false};
  std::thread timer_thread_{};
};

}  // namespace quota_watch::core
