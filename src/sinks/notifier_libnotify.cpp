#include "sinks/notifier.hpp"

#include <memory>
#include <stdexcept>
#include <string>

extern "C" {
#include <libnotify/notify.h>
}

namespace quota_watch::sinks {
namespace {

NotifyUrgency to_notify_urgency(const urgency level) {
  switch (level) {
    case urgency::LOW:
      return NOTIFY_URGENCY_LOW;
    case urgency::NORMAL:
      return NOTIFY_URGENCY_NORMAL;
    case urgency::CRITICAL:
      return NOTIFY_URGENCY_CRITICAL;
  }
  return NOTIFY_URGENCY_NORMAL;
}

class DesktopNotifier final : public Notifier {
 public:
  DesktopNotifier(const std::string& app_name, std::chrono::milliseconds timeout)
      : timeout_ms_(static_cast<int>(timeout.count())) {
    initialized_ = notify_init(app_name.c_str()) != FALSE;
  }

  ~DesktopNotifier() override {
    if (initialized_) {
      notify_uninit();
    }
  }

  DesktopNotifier(const DesktopNotifier&) = delete;
  DesktopNotifier& operator=(const DesktopNotifier&) = delete;

  bool available() const override { return initialized_; }

  void notify(const Notification& notification) override {
    if (!initialized_) {
      throw std::runtime_error("libnotify is not initialized");
    }

    NotifyNotification* handle = notify_notification_new(
        notification.title.c_str(), notification.body.c_str(),
        notification.level == urgency::CRITICAL ? "dialog-warning" : "dialog-information");
    if (handle == nullptr) {
      throw std::runtime_error("notify_notification_new failed");
    }

    notify_notification_set_urgency(handle, to_notify_urgency(notification.level));
    notify_notification_set_timeout(handle, timeout_ms_);

    GError* error = nullptr;
    const gboolean shown = notify_notification_show(handle, &error);
    g_object_unref(G_OBJECT(handle));

    if (shown == FALSE) {
      const std::string message = error != nullptr && error->message != nullptr ? error->message : "unknown error";
      if (error != nullptr) {
        g_error_free(error);
      }
      throw std::runtime_error("notify_notification_show failed: " + message);
    }
  }

 private:
  int timeout_ms_;
  bool initialized_{false};
};

}  // namespace

std::unique_ptr<Notifier> make_desktop_notifier(const std::string& app_name, const std::chrono::milliseconds timeout) {
  return std::make_unique<DesktopNotifier>(app_name, timeout);
}

}  // namespace quota_watch::sinks
