#include "runtime/actor_runtime_config.hpp"

#include <memory>
#include <utility>

#include "support/duration_format.hpp"

namespace ActorHost::Runtime {

using Serialization::Payload;

ActorRuntimeConfig::ActorRuntimeConfig(const ActorRuntimeConfig& other) {
  std::unique_lock lck(other.mtx);
  _actor_idle_timeout = other._actor_idle_timeout;
  _actor_scan_interval = other._actor_scan_interval;
  _drain_ongoing_call_timeout = other._drain_ongoing_call_timeout;
  _drain_rebalanced_actors = other._drain_rebalanced_actors;
  _reentrancy = other._reentrancy;
  _reminders_storage_partitions = other._reminders_storage_partitions;
  _entities = other._entities;
}

ActorRuntimeConfig& ActorRuntimeConfig::operator=(
    const ActorRuntimeConfig& other) {
  if (this == &other) {
    return *this;
  }
  std::scoped_lock lck(mtx, other.mtx);
  _actor_idle_timeout = other._actor_idle_timeout;
  _actor_scan_interval = other._actor_scan_interval;
  _drain_ongoing_call_timeout = other._drain_ongoing_call_timeout;
  _drain_rebalanced_actors = other._drain_rebalanced_actors;
  _reentrancy = other._reentrancy;
  _reminders_storage_partitions = other._reminders_storage_partitions;
  _entities = other._entities;
  return *this;
}

std::chrono::milliseconds ActorRuntimeConfig::actor_idle_timeout() const {
  std::unique_lock lck(mtx);
  return _actor_idle_timeout;
}

void ActorRuntimeConfig::set_actor_idle_timeout(
    std::chrono::milliseconds timeout) {
  std::unique_lock lck(mtx);
  _actor_idle_timeout = timeout;
}

std::chrono::milliseconds ActorRuntimeConfig::actor_scan_interval() const {
  std::unique_lock lck(mtx);
  return _actor_scan_interval;
}

void ActorRuntimeConfig::set_actor_scan_interval(
    std::chrono::milliseconds interval) {
  std::unique_lock lck(mtx);
  _actor_scan_interval = interval;
}

std::chrono::milliseconds ActorRuntimeConfig::drain_ongoing_call_timeout()
    const {
  std::unique_lock lck(mtx);
  return _drain_ongoing_call_timeout;
}

void ActorRuntimeConfig::set_drain_ongoing_call_timeout(
    std::chrono::milliseconds timeout) {
  std::unique_lock lck(mtx);
  _drain_ongoing_call_timeout = timeout;
}

bool ActorRuntimeConfig::drain_rebalanced_actors() const {
  std::unique_lock lck(mtx);
  return _drain_rebalanced_actors;
}

void ActorRuntimeConfig::set_drain_rebalanced_actors(bool drain) {
  std::unique_lock lck(mtx);
  _drain_rebalanced_actors = drain;
}

std::optional<ActorReentrancyConfig> ActorRuntimeConfig::reentrancy() const {
  std::unique_lock lck(mtx);
  return _reentrancy;
}

void ActorRuntimeConfig::set_reentrancy(
    std::optional<ActorReentrancyConfig> reentrancy) {
  std::unique_lock lck(mtx);
  _reentrancy = reentrancy;
}

std::optional<int32_t> ActorRuntimeConfig::reminders_storage_partitions()
    const {
  std::unique_lock lck(mtx);
  return _reminders_storage_partitions;
}

void ActorRuntimeConfig::set_reminders_storage_partitions(
    std::optional<int32_t> partitions) {
  std::unique_lock lck(mtx);
  _reminders_storage_partitions = partitions;
}

std::vector<std::string> ActorRuntimeConfig::entities() const {
  std::unique_lock lck(mtx);
  return _entities;
}

void ActorRuntimeConfig::update_entities(std::vector<std::string> entities) {
  std::unique_lock lck(mtx);
  _entities = std::move(entities);
}

Payload ActorRuntimeConfig::to_payload() const {
  std::unique_lock lck(mtx);
  Payload payload;
  payload.set_attr("entities", Payload::StringList(_entities));
  payload.set_attr("actorIdleTimeout",
                   Support::DurationFormat::to_string(_actor_idle_timeout));
  payload.set_attr("actorScanInterval",
                   Support::DurationFormat::to_string(_actor_scan_interval));
  payload.set_attr(
      "drainOngoingCallTimeout",
      Support::DurationFormat::to_string(_drain_ongoing_call_timeout));
  payload.set_attr("drainRebalancedActors", _drain_rebalanced_actors);
  if (_reentrancy) {
    auto reentrancy = std::make_shared<Payload>();
    reentrancy->set_attr("enabled", _reentrancy->enabled);
    reentrancy->set_attr("maxStackDepth", _reentrancy->max_stack_depth);
    payload.set_attr("reentrancy", std::move(reentrancy));
  }
  if (_reminders_storage_partitions) {
    payload.set_attr("remindersStoragePartitions",
                     *_reminders_storage_partitions);
  }
  return payload;
}

}  // namespace ActorHost::Runtime
