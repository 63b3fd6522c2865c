#include "core/poller.hpp"

#include <cmath>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "core/timestamp.hpp"
#include "risk/tier_classifier.hpp"
#include "sources/fetch_error.hpp"

namespace quota_watch::core {
namespace {

bool percent_in_range(const double percent) { return std::isfinite(percent) && percent >= 0.0 && percent <= 100.0; }

void check_snapshot(const model::UsageSnapshot& snapshot) {
  if (!percent_in_range(snapshot.five_hour_percent) || !percent_in_range(snapshot.weekly_percent)) {
    throw sources::FetchError(model::error_kind::MALFORMED_RESPONSE,
                              "usage percentage outside [0, 100]: five_hour=" +
                                  std::to_string(snapshot.five_hour_percent) +
                                  " weekly=" + std::to_string(snapshot.weekly_percent));
  }
}

}  // namespace

Poller::Poller(MonitorConfig config, std::unique_ptr<sources::CredentialSource> credentials,
               std::unique_ptr<sources::UsageClient> client, std::unique_ptr<sinks::AlertDispatcher> dispatcher)
    : config_(std::move(config)),
      credentials_(std::move(credentials)),
      client_(std::move(client)),
      dispatcher_(std::move(dispatcher)) {
  validate_monitor_config(config_);
  if (credentials_ == nullptr || client_ == nullptr) {
    throw std::invalid_argument("poller requires a credential source and a usage client");
  }
}

Poller::~Poller() { stop(); }

void Poller::start() { start(std::chrono::duration_cast<std::chrono::milliseconds>(config_.poll_interval)); }

void Poller::start(const std::chrono::milliseconds interval) {
  if (interval.count() <= 0) {
    throw std::invalid_argument("poll interval must be greater than 0");
  }

  std::lock_guard<std::mutex> lock(timer_mutex_);
  if (timer_thread_.joinable()) {
    return;
  }

  stop_requested_ = false;
  timer_thread_ = std::thread([this, interval]() { run_loop(interval); });
  std::cerr << "[poller] started with interval_ms=" << interval.count() << '\n';
}

void Poller::stop() {
  std::thread worker;
  {
    std::lock_guard<std::mutex> lock(timer_mutex_);
    stop_requested_ = true;
    worker = std::move(timer_thread_);
  }
  timer_wakeup_.notify_all();

  if (worker.joinable()) {
    worker.join();
    std::cerr << "[poller] stopped\n";
  }
}

bool Poller::running() const {
  std::lock_guard<std::mutex> lock(timer_mutex_);
  return timer_thread_.joinable() && !stop_requested_;
}

void Poller::run_loop(const std::chrono::milliseconds interval) {
  auto next_wakeup = std::chrono::steady_clock::now();

  std::unique_lock<std::mutex> lock(timer_mutex_);
  while (!stop_requested_) {
    lock.unlock();
    try {
      poll_once();
    } catch (const std::exception& ex) {
      std::cerr << "[poller] cycle aborted: " << ex.what() << '\n';
    } catch (...) {
      std::cerr << "[poller] cycle aborted by a non-standard exception\n";
    }
    lock.lock();

    next_wakeup += interval;
    const auto now = std::chrono::steady_clock::now();
    if (next_wakeup < now) {
      // Overran one or more periods; resume the cadence from now.
      next_wakeup = now;
    }
    timer_wakeup_.wait_until(lock, next_wakeup, [this]() { return stop_requested_; });
  }
}

model::CurrentState Poller::poll_once() {
  std::unique_lock<std::mutex> lock(state_mutex_);
  if (in_flight_) {
    const auto joined_generation = generation_;
    ++stats_.cycles_joined;
    cycle_done_.wait(lock, [this, joined_generation]() { return generation_ != joined_generation; });
    return published_;
  }
  in_flight_ = true;
  lock.unlock();

  // Releases the cycle on every exit path so joiners and later callers never
  // wait on a cycle that unwound.
  struct CycleRelease {
    Poller& poller;
    std::unique_lock<std::mutex>& lock;
    ~CycleRelease() {
      if (!lock.owns_lock()) {
        lock.lock();
      }
      poller.in_flight_ = false;
      ++poller.generation_;
      lock.unlock();
      poller.cycle_done_.notify_all();
    }
  } release{*this, lock};

  CycleTally tally{};
  model::CurrentState next = run_cycle(tally);
  log_outcome(next);

  lock.lock();
  published_ = std::move(next);
  ++stats_.cycles_run;
  if (tally.succeeded) {
    ++stats_.successes;
  } else {
    ++stats_.failures;
  }
  stats_.notifications += tally.notifications;
  return published_;
}

model::CurrentState Poller::refresh_now() { return poll_once(); }

model::CurrentState Poller::current_state() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return published_;
}

PollerStats Poller::stats() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return stats_;
}

model::CurrentState Poller::run_cycle(CycleTally& tally) {
  model::CurrentState state{};
  state.last_checked_at = wall_clock_now();
  state.cycle = ++cycles_completed_;

  std::optional<model::UsageSnapshot> fresh_snapshot{};
  std::string token;
  bool have_token = false;

  try {
    token = credentials_->get_token();
    have_token = true;
  } catch (const sources::FetchError& ex) {
    state.last_error = model::error_kind::NOT_AUTHENTICATED;
    state.last_error_detail = ex.what();
  } catch (const std::exception& ex) {
    state.last_error = model::error_kind::NOT_AUTHENTICATED;
    state.last_error_detail = std::string("credential error: ") + ex.what();
  }

  if (have_token) {
    try {
      auto snapshot = client_->fetch_usage(token);
      check_snapshot(snapshot);
      fresh_snapshot = std::move(snapshot);
    } catch (const sources::FetchError& ex) {
      state.last_error = ex.kind();
      state.last_error_detail = ex.what();
      if (ex.kind() == model::error_kind::AUTH_ERROR) {
        credentials_->invalidate();
      }
    } catch (const std::exception& ex) {
      state.last_error = model::error_kind::MALFORMED_RESPONSE;
      state.last_error_detail = ex.what();
    }
  }

  if (fresh_snapshot.has_value()) {
    const auto events = risk::crossings(cache_.get(), *fresh_snapshot, config_.thresholds);
    cache_.put(*fresh_snapshot);
    tally.succeeded = true;

    for (const auto& event : events) {
      std::cerr << "[poller] " << model::to_string(event.which) << " crossed " << model::to_string(event.from)
                << " -> " << model::to_string(event.to) << " at " << event.percent << "%\n";
    }
    if (dispatcher_ != nullptr) {
      tally.notifications = dispatcher_->on_success(*fresh_snapshot, events);
    }
  } else if (dispatcher_ != nullptr && state.last_error.has_value()) {
    tally.notifications = dispatcher_->on_failure(*state.last_error);
  }

  state.snapshot = cache_.get();
  if (tally.succeeded) {
    state.fresh = model::freshness::LIVE;
  } else if (!cache_.empty()) {
    state.fresh = model::freshness::STALE;
  } else {
    state.fresh = model::freshness::UNAVAILABLE;
  }

  return state;
}

void Poller::log_outcome(const model::CurrentState& state) {
  if (!state.last_error.has_value()) {
    if (last_logged_error_.has_value()) {
      std::cerr << "[poller] usage fetch recovered after " << model::to_string(*last_logged_error_) << '\n';
      last_logged_error_.reset();
    }
    return;
  }

  const auto kind = *state.last_error;
  const bool changed = !last_logged_error_.has_value() || *last_logged_error_ != kind;
  if (changed || kind == model::error_kind::MALFORMED_RESPONSE) {
    std::cerr << "[poller] cycle " << state.cycle << " failed (" << model::to_string(kind)
              << "): " << state.last_error_detail << "; serving " << model::to_string(state.fresh) << " state\n";
  }
  last_logged_error_ = kind;
}

}  // namespace quota_watch::core
