#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace quota_watch::model {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

enum class tier : std::uint8_t {
    HEALTHY = 0,
    WARNING = 1,
    DANGER = 2,
    CRITICAL = 3,
};

enum class dimension : std::uint8_t {
    FIVE_HOUR = 0,
    WEEKLY = 1,
};

enum class freshness : std::uint8_t {
    LIVE = 0,
    STALE = 1,
    UNAVAILABLE = 2,
};

enum class error_kind : std::uint8_t {
    NOT_AUTHENTICATED = 0,
    NETWORK_ERROR = 1,
    AUTH_ERROR = 2,
    MALFORMED_RESPONSE = 3,
};

// One observation. Percentages are in [0,100]; reset times are absent when
// the remote side reports no active window.
struct UsageSnapshot {
    double five_hour_percent{0.0};
    double weekly_percent{0.0};
    std::optional<Timestamp> five_hour_reset_at{};
    std::optional<Timestamp> weekly_reset_at{};
    Timestamp captured_at{};

    [[nodiscard]] double percent(dimension which) const noexcept {
        return which == dimension::FIVE_HOUR ? five_hour_percent : weekly_percent;
    }

    friend bool operator==(const UsageSnapshot&, const UsageSnapshot&) = default;
};

struct CrossingEvent {
    dimension which{dimension::FIVE_HOUR};
    tier from{tier::HEALTHY};
    tier to{tier::HEALTHY};
    double percent{0.0};
    Timestamp at{};

    friend bool operator==(const CrossingEvent&, const CrossingEvent&) = default;
};

// Value handed to presentation. Replaced as a whole at the end of every cycle.
struct CurrentState {
    std::optional<UsageSnapshot> snapshot{};
    freshness fresh{freshness::UNAVAILABLE};
    std::optional<error_kind> last_error{};
    std::string last_error_detail{};
    std::optional<Timestamp> last_checked_at{};
    std::uint64_t cycle{0};
};

inline const char* to_string(const tier value) noexcept {
    switch (value) {
        case tier::HEALTHY:
            return "healthy";
        case tier::WARNING:
            return "warning";
        case tier::DANGER:
            return "danger";
        case tier::CRITICAL:
            return "critical";
    }
    return "unknown";
}

inline const char* to_string(const dimension value) noexcept {
    return value == dimension::FIVE_HOUR ? "five_hour" : "weekly";
}

inline const char* to_string(const freshness value) noexcept {
    switch (value) {
        case freshness::LIVE:
            return "live";
        case freshness::STALE:
            return "stale";
        case freshness::UNAVAILABLE:
            return "unavailable";
    }
    return "unknown";
}

inline const char* to_string(const error_kind value) noexcept {
    switch (value) {
        case error_kind::NOT_AUTHENTICATED:
            return "not_authenticated";
        case error_kind::NETWORK_ERROR:
            return "network_error";
        case error_kind::AUTH_ERROR:
            return "auth_error";
        case error_kind::MALFORMED_RESPONSE:
            return "malformed_response";
    }
    return "unknown";
}

inline bool is_auth_failure(const error_kind value) noexcept {
    return value == error_kind::NOT_AUTHENTICATED || value == error_kind::AUTH_ERROR;
}

}  // namespace quota_watch::model
