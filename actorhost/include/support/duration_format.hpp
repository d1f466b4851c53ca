#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace ActorHost::Support {

// Duration strings as understood by the sidecar, e.g. "1h0m0s" or
// "0h0m1s500ms".
struct DurationFormat {
  static std::string to_string(std::chrono::milliseconds duration);

  // Accepts any concatenation of <n>h, <n>m, <n>s, <n>ms and <n>us.
  static std::optional<std::chrono::milliseconds> parse(std::string_view raw);
};

}  // namespace ActorHost::Support
