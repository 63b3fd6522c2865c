#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace quota_watch::sinks {

enum class urgency : std::uint8_t {
  LOW = 0,
  NORMAL = 1,
  CRITICAL = 2,
};

struct Notification {
  std::string title;
  std::string body;
  urgency level{urgency::NORMAL};
};

class Notifier {
 public:
  virtual bool available() const = 0;
  // May throw; callers treat delivery as best effort.
  virtual void notify(const Notification& notification) = 0;
  virtual ~Notifier() = default;
};

std::unique_ptr<Notifier> make_desktop_notifier(const std::string& app_name, std::chrono::milliseconds timeout);
std::unique_ptr<Notifier> make_log_notifier();

}  // namespace quota_watch::sinks
