#include "client/local_sidecar_client.hpp"

#include <string>

#include "support/logger.hpp"

namespace ActorHost::Client {

void LocalSidecarClient::register_reminder(std::string_view actor_type,
                                           std::string_view actor_id,
                                           std::string_view name,
                                           const Bytes& data) {
  std::unique_lock lck(mtx);
  reminders.insert_or_assign(make_key(actor_type, actor_id, name), data);
  Support::Logger::debug("SIDECAR-CLIENT", "Registered reminder %s for %s/%s",
                         std::string(name).c_str(),
                         std::string(actor_type).c_str(),
                         std::string(actor_id).c_str());
}

void LocalSidecarClient::unregister_reminder(std::string_view actor_type,
                                             std::string_view actor_id,
                                             std::string_view name) {
  std::unique_lock lck(mtx);
  reminders.erase(make_key(actor_type, actor_id, name));
}

void LocalSidecarClient::register_timer(std::string_view actor_type,
                                        std::string_view actor_id,
                                        std::string_view name,
                                        const Bytes& data) {
  std::unique_lock lck(mtx);
  timers.insert_or_assign(make_key(actor_type, actor_id, name), data);
  Support::Logger::debug("SIDECAR-CLIENT", "Registered timer %s for %s/%s",
                         std::string(name).c_str(),
                         std::string(actor_type).c_str(),
                         std::string(actor_id).c_str());
}

void LocalSidecarClient::unregister_timer(std::string_view actor_type,
                                          std::string_view actor_id,
                                          std::string_view name) {
  std::unique_lock lck(mtx);
  timers.erase(make_key(actor_type, actor_id, name));
}

void LocalSidecarClient::save_state(std::string_view actor_type,
                                    std::string_view actor_id,
                                    std::string_view key, const Bytes& value) {
  std::unique_lock lck(mtx);
  state.insert_or_assign(make_key(actor_type, actor_id, key), value);
}

std::optional<Bytes> LocalSidecarClient::get_state(std::string_view actor_type,
                                                   std::string_view actor_id,
                                                   std::string_view key) {
  std::unique_lock lck(mtx);
  return lookup(state, make_key(actor_type, actor_id, key));
}

void LocalSidecarClient::delete_state(std::string_view actor_type,
                                      std::string_view actor_id,
                                      std::string_view key) {
  std::unique_lock lck(mtx);
  state.erase(make_key(actor_type, actor_id, key));
}

std::optional<Bytes> LocalSidecarClient::reminder(std::string_view actor_type,
                                                  std::string_view actor_id,
                                                  std::string_view name) const {
  std::unique_lock lck(mtx);
  return lookup(reminders, make_key(actor_type, actor_id, name));
}

std::optional<Bytes> LocalSidecarClient::timer(std::string_view actor_type,
                                               std::string_view actor_id,
                                               std::string_view name) const {
  std::unique_lock lck(mtx);
  return lookup(timers, make_key(actor_type, actor_id, name));
}

std::optional<Bytes> LocalSidecarClient::lookup(
    const std::map<Key, Bytes>& store, const Key& key) {
  auto it = store.find(key);
  if (it == store.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace ActorHost::Client
