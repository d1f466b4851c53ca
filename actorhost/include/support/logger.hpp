#pragma once

#define __STDC_FORMAT_MACROS
#include <atomic>
#include <chrono>
#include <cinttypes>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <set>
#include <string_view>

#define ACTORHOST_LOG_LEVEL_TRACE 6
#define ACTORHOST_LOG_LEVEL_DEBUG 5
#define ACTORHOST_LOG_LEVEL_INFO 4
#define ACTORHOST_LOG_LEVEL_WARNING 3
#define ACTORHOST_LOG_LEVEL_ERROR 2
#define ACTORHOST_LOG_LEVEL_FATAL 1

#ifndef ACTORHOST_LOG_LEVEL
#define ACTORHOST_LOG_LEVEL ACTORHOST_LOG_LEVEL_INFO
#endif

namespace ActorHost::Support {
struct Logger {
  static const std::set<std::string_view> valid_levels;

  // Runtime threshold, bounded by ACTORHOST_LOG_LEVEL at compile time.
  static bool set_level(std::string_view level_name);
  static int level() { return threshold.load(); }

  template <typename... Args>
  static void trace(std::string_view component, Args... args) {
#if ACTORHOST_LOG_LEVEL >= ACTORHOST_LOG_LEVEL_TRACE
    if (threshold >= ACTORHOST_LOG_LEVEL_TRACE) {
      log("TRACE", component, args...);
    }
#endif
  }

  template <typename... Args>
  static void debug(std::string_view component, Args... args) {
#if ACTORHOST_LOG_LEVEL >= ACTORHOST_LOG_LEVEL_DEBUG
    if (threshold >= ACTORHOST_LOG_LEVEL_DEBUG) {
      log("DEBUG", component, args...);
    }
#endif
  }

  template <typename... Args>
  static void info(std::string_view component, Args... args) {
#if ACTORHOST_LOG_LEVEL >= ACTORHOST_LOG_LEVEL_INFO
    if (threshold >= ACTORHOST_LOG_LEVEL_INFO) {
      log("INFO", component, args...);
    }
#endif
  }

  template <typename... Args>
  static void warning(std::string_view component, Args... args) {
#if ACTORHOST_LOG_LEVEL >= ACTORHOST_LOG_LEVEL_WARNING
    if (threshold >= ACTORHOST_LOG_LEVEL_WARNING) {
      log("WARNING", component, args...);
    }
#endif
  }

  template <typename... Args>
  static void error(std::string_view component, Args... args) {
#if ACTORHOST_LOG_LEVEL >= ACTORHOST_LOG_LEVEL_ERROR
    if (threshold >= ACTORHOST_LOG_LEVEL_ERROR) {
      log("ERROR", component, args...);
    }
#endif
  }

  template <typename... Args>
  static void fatal(std::string_view component, Args... args) {
#if ACTORHOST_LOG_LEVEL >= ACTORHOST_LOG_LEVEL_FATAL
    if (threshold >= ACTORHOST_LOG_LEVEL_FATAL) {
      log("FATAL", component, args...);
    }
#endif
  }

  static void log(std::string_view level, std::string_view component,
                  const char* fmt, ...);

 private:
  static std::atomic<int> threshold;
  static std::mutex output_mtx;
};
}  // namespace ActorHost::Support
