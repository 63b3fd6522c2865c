#include "core/timestamp.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace quota_watch::core {
namespace {

bool read_digits(const std::string& text, std::size_t pos, std::size_t count, int& out) {
  if (pos + count > text.size()) {
    return false;
  }
  int value = 0;
  for (std::size_t i = pos; i < pos + count; ++i) {
    if (std::isdigit(static_cast<unsigned char>(text[i])) == 0) {
      return false;
    }
    value = (value * 10) + (text[i] - '0');
  }
  out = value;
  return true;
}

}  // namespace

std::optional<model::Timestamp> parse_iso8601(const std::string& text) {
  // 2025-11-04T18:00:00
  if (text.size() < 19 || text[4] != '-' || text[7] != '-' || (text[10] != 'T' && text[10] != ' ') ||
      text[13] != ':' || text[16] != ':') {
    return std::nullopt;
  }

  std::tm tm_info{};
  int year = 0;
  int month = 0;
  int day = 0;
  int hour = 0;
  int minute = 0;
  int second = 0;
  if (!read_digits(text, 0, 4, year) || !read_digits(text, 5, 2, month) || !read_digits(text, 8, 2, day) ||
      !read_digits(text, 11, 2, hour) || !read_digits(text, 14, 2, minute) || !read_digits(text, 17, 2, second)) {
    return std::nullopt;
  }
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
    return std::nullopt;
  }

  tm_info.tm_year = year - 1900;
  tm_info.tm_mon = month - 1;
  tm_info.tm_mday = day;
  tm_info.tm_hour = hour;
  tm_info.tm_min = minute;
  tm_info.tm_sec = second;

  std::size_t pos = 19;
  std::chrono::microseconds fraction{0};
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    std::int64_t micros = 0;
    std::size_t digits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
      if (digits < 6) {
        micros = (micros * 10) + (text[pos] - '0');
      }
      ++digits;
      ++pos;
    }
    if (digits == 0) {
      return std::nullopt;
    }
    for (std::size_t i = digits; i < 6; ++i) {
      micros *= 10;
    }
    fraction = std::chrono::microseconds(micros);
  }

  std::chrono::seconds offset{0};
  if (pos < text.size()) {
    const char sign = text[pos];
    if (sign == 'Z' || sign == 'z') {
      ++pos;
    } else if (sign == '+' || sign == '-') {
      int offset_hours = 0;
      int offset_minutes = 0;
      if (!read_digits(text, pos + 1, 2, offset_hours) || pos + 3 >= text.size() || text[pos + 3] != ':' ||
          !read_digits(text, pos + 4, 2, offset_minutes)) {
        return std::nullopt;
      }
      offset = std::chrono::hours(offset_hours) + std::chrono::minutes(offset_minutes);
      if (sign == '-') {
        offset = -offset;
      }
      pos += 6;
    } else {
      return std::nullopt;
    }
  }
  if (pos != text.size()) {
    return std::nullopt;
  }

  const std::time_t utc_time = timegm(&tm_info);
  if (utc_time == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }

  return model::Clock::from_time_t(utc_time) - offset +
         std::chrono::duration_cast<model::Clock::duration>(fraction);
}

std::string format_local_clock(const model::Timestamp at) {
  const std::time_t raw = model::Clock::to_time_t(at);
  std::tm local{};
  localtime_r(&raw, &local);

  std::ostringstream out;
  out << std::put_time(&local, "%H:%M");
  return out.str();
}

std::string format_reset_in(const model::Timestamp reset_at, const model::Timestamp now) {
  const auto total_seconds = std::chrono::duration_cast<std::chrono::seconds>(reset_at - now).count();
  if (total_seconds < 0) {
    return "soon";
  }

  const auto hours = total_seconds / 3600;
  const auto minutes = (total_seconds % 3600) / 60;

  std::ostringstream out;
  if (hours > 24) {
    out << "in " << (hours / 24) << 'd';
  } else if (hours > 0) {
    out << "in " << hours << "h " << minutes << 'm';
  } else {
    out << "in " << minutes << 'm';
  }
  return out.str();
}

}  // namespace quota_watch::core
