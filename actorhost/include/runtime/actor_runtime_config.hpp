#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "serialization/payload.hpp"

namespace ActorHost::Runtime {

struct ActorReentrancyConfig {
  bool enabled = false;
  int32_t max_stack_depth = 32;
};

/*
 * Deployment settings reported to the sidecar. The entity list mirrors the
 * registered actor types and is rewritten by the runtime whenever
 * registrations or the config itself change. The object is shared by
 * handle, so all members are guarded.
 */
class ActorRuntimeConfig {
 public:
  constexpr static std::chrono::milliseconds DEFAULT_IDLE_TIMEOUT =
      std::chrono::hours(1);
  constexpr static std::chrono::milliseconds DEFAULT_SCAN_INTERVAL =
      std::chrono::seconds(30);
  constexpr static std::chrono::milliseconds DEFAULT_DRAIN_TIMEOUT =
      std::chrono::minutes(1);

  ActorRuntimeConfig() = default;

  ActorRuntimeConfig(const ActorRuntimeConfig& other);
  ActorRuntimeConfig& operator=(const ActorRuntimeConfig& other);

  std::chrono::milliseconds actor_idle_timeout() const;
  void set_actor_idle_timeout(std::chrono::milliseconds timeout);

  std::chrono::milliseconds actor_scan_interval() const;
  void set_actor_scan_interval(std::chrono::milliseconds interval);

  std::chrono::milliseconds drain_ongoing_call_timeout() const;
  void set_drain_ongoing_call_timeout(std::chrono::milliseconds timeout);

  bool drain_rebalanced_actors() const;
  void set_drain_rebalanced_actors(bool drain);

  std::optional<ActorReentrancyConfig> reentrancy() const;
  void set_reentrancy(std::optional<ActorReentrancyConfig> reentrancy);

  std::optional<int32_t> reminders_storage_partitions() const;
  void set_reminders_storage_partitions(std::optional<int32_t> partitions);

  std::vector<std::string> entities() const;
  void update_entities(std::vector<std::string> entities);

  // Renders the config with the key names the sidecar expects.
  Serialization::Payload to_payload() const;

 private:
  std::chrono::milliseconds _actor_idle_timeout = DEFAULT_IDLE_TIMEOUT;
  std::chrono::milliseconds _actor_scan_interval = DEFAULT_SCAN_INTERVAL;
  std::chrono::milliseconds _drain_ongoing_call_timeout = DEFAULT_DRAIN_TIMEOUT;
  bool _drain_rebalanced_actors = true;
  std::optional<ActorReentrancyConfig> _reentrancy;
  std::optional<int32_t> _reminders_storage_partitions;
  std::vector<std::string> _entities;
  mutable std::mutex mtx;
};

}  // namespace ActorHost::Runtime
