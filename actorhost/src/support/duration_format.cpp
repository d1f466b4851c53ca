#include "support/duration_format.hpp"

#include <fmt/format.h>

#include <cctype>
#include <cstdint>
#include <limits>

namespace ActorHost::Support {

std::string DurationFormat::to_string(std::chrono::milliseconds duration) {
  int64_t total_ms = duration.count();
  const char* sign = "";
  if (total_ms < 0) {
    sign = "-";
    total_ms = -total_ms;
  }
  int64_t hours = total_ms / 3600000;
  int64_t minutes = (total_ms / 60000) % 60;
  int64_t seconds = (total_ms / 1000) % 60;
  int64_t milliseconds = total_ms % 1000;
  if (milliseconds != 0) {
    return fmt::format("{}{}h{}m{}s{}ms", sign, hours, minutes, seconds,
                       milliseconds);
  }
  return fmt::format("{}{}h{}m{}s", sign, hours, minutes, seconds);
}

std::optional<std::chrono::milliseconds> DurationFormat::parse(
    std::string_view raw) {
  constexpr int64_t max_value = std::numeric_limits<int64_t>::max();
  if (raw.empty()) {
    return std::nullopt;
  }
  bool negative = false;
  if (raw.front() == '-') {
    negative = true;
    raw.remove_prefix(1);
    if (raw.empty()) {
      return std::nullopt;
    }
  }

  int64_t total_us = 0;
  size_t pos = 0;
  while (pos < raw.size()) {
    size_t digits_end = pos;
    int64_t value = 0;
    while (digits_end < raw.size() &&
           std::isdigit(static_cast<unsigned char>(raw[digits_end]))) {
      int64_t digit = raw[digits_end] - '0';
      if (value > (max_value - digit) / 10) {
        return std::nullopt;
      }
      value = value * 10 + digit;
      digits_end++;
    }
    if (digits_end == pos) {
      return std::nullopt;
    }

    std::string_view rest = raw.substr(digits_end);
    int64_t unit_us = 0;
    if (rest.substr(0, 2) == "ms") {
      unit_us = 1000;
      pos = digits_end + 2;
    } else if (rest.substr(0, 2) == "us") {
      unit_us = 1;
      pos = digits_end + 2;
    } else if (rest.substr(0, 1) == "h") {
      unit_us = 3600000000;
      pos = digits_end + 1;
    } else if (rest.substr(0, 1) == "m") {
      unit_us = 60000000;
      pos = digits_end + 1;
    } else if (rest.substr(0, 1) == "s") {
      unit_us = 1000000;
      pos = digits_end + 1;
    } else {
      return std::nullopt;
    }

    if (value > max_value / unit_us ||
        value * unit_us > max_value - total_us) {
      return std::nullopt;
    }
    total_us += value * unit_us;
  }

  auto result = std::chrono::milliseconds(total_us / 1000);
  return negative ? -result : result;
}

}  // namespace ActorHost::Support
