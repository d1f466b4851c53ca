#include "support/logger.hpp"

namespace ActorHost::Support {

const std::set<std::string_view> Logger::valid_levels = {
    "TRACE", "DEBUG", "INFO", "WARNING", "ERROR", "FATAL"};

std::atomic<int> Logger::threshold{ACTORHOST_LOG_LEVEL};

std::mutex Logger::output_mtx;

bool Logger::set_level(std::string_view level_name) {
  if (valid_levels.find(level_name) == valid_levels.end()) {
    return false;
  }
  if (level_name == "TRACE") {
    threshold = ACTORHOST_LOG_LEVEL_TRACE;
  } else if (level_name == "DEBUG") {
    threshold = ACTORHOST_LOG_LEVEL_DEBUG;
  } else if (level_name == "INFO") {
    threshold = ACTORHOST_LOG_LEVEL_INFO;
  } else if (level_name == "WARNING") {
    threshold = ACTORHOST_LOG_LEVEL_WARNING;
  } else if (level_name == "ERROR") {
    threshold = ACTORHOST_LOG_LEVEL_ERROR;
  } else {
    threshold = ACTORHOST_LOG_LEVEL_FATAL;
  }
  return true;
}

void Logger::log(std::string_view level, std::string_view component,
                 const char* fmt, ...) {
  std::unique_lock lck(output_mtx);
  printf("[%" PRIu64 "][%.*s][%.*s]",
         static_cast<uint64_t>(
             std::chrono::duration_cast<std::chrono::milliseconds>(
                 std::chrono::system_clock::now().time_since_epoch())
                 .count()),
         static_cast<int>(level.size()), level.data(),
         static_cast<int>(component.size()), component.data());

  va_list params;
  va_start(params, fmt);
  vprintf(fmt, params);
  va_end(params);
  printf("\n");
}

}  // namespace ActorHost::Support
