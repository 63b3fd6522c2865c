#include "sinks/notifier.hpp"

#include <iostream>
#include <memory>

namespace quota_watch::sinks {
namespace {

class LogNotifier final : public Notifier {
 public:
  bool available() const override { return true; }

  void notify(const Notification& notification) override {
    std::cerr << "[notify] " << notification.title << ": " << notification.body << '\n';
  }
};

}  // namespace

std::unique_ptr<Notifier> make_log_notifier() { return std::make_unique<LogNotifier>(); }

}  // namespace quota_watch::sinks
