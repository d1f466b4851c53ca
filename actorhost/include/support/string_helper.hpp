#pragma once

#include <string_view>
#include <vector>

namespace ActorHost::Support {

struct StringHelper {
  enum class EmptySegments { SKIP, KEEP };

  // Splits at every character contained in delimiters. With KEEP, the
  // pieces between adjacent delimiters and after a trailing delimiter are
  // returned as empty views.
  static std::vector<std::string_view> string_split(
      std::string_view input, std::string_view delimiters = ",",
      EmptySegments empty_segments = EmptySegments::SKIP) {
    std::vector<std::string_view> segments;
    size_t pos = 0;
    while (true) {
      size_t end_pos = input.find_first_of(delimiters, pos);
      std::string_view segment = input.substr(
          pos, end_pos == std::string_view::npos ? end_pos : end_pos - pos);
      if (!segment.empty() || empty_segments == EmptySegments::KEEP) {
        segments.push_back(segment);
      }
      if (end_pos == std::string_view::npos) {
        break;
      }
      pos = end_pos + 1;
    }
    return segments;
  }

  // "/a/b" -> "a/b"
  static std::string_view strip_prefix(std::string_view input, char prefix) {
    if (!input.empty() && input.front() == prefix) {
      input.remove_prefix(1);
    }
    return input;
  }
};

}  // namespace ActorHost::Support
