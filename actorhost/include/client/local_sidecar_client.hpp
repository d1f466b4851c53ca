#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

#include "client/sidecar_client.hpp"

namespace ActorHost::Client {

/*
 * Process-local stand-in for the sidecar. Reminder and timer registrations
 * and state writes are kept in memory so that handlers work without a
 * network transport. Nothing is scheduled: the sidecar is the party that
 * fires reminders and timers.
 */
class LocalSidecarClient : public SidecarClient {
 public:
  using Key = std::tuple<std::string, std::string, std::string>;

  void register_reminder(std::string_view actor_type, std::string_view actor_id,
                         std::string_view name, const Bytes& data) override;
  void unregister_reminder(std::string_view actor_type,
                           std::string_view actor_id,
                           std::string_view name) override;
  void register_timer(std::string_view actor_type, std::string_view actor_id,
                      std::string_view name, const Bytes& data) override;
  void unregister_timer(std::string_view actor_type, std::string_view actor_id,
                        std::string_view name) override;

  void save_state(std::string_view actor_type, std::string_view actor_id,
                  std::string_view key, const Bytes& value) override;
  std::optional<Bytes> get_state(std::string_view actor_type,
                                 std::string_view actor_id,
                                 std::string_view key) override;
  void delete_state(std::string_view actor_type, std::string_view actor_id,
                    std::string_view key) override;

  std::optional<Bytes> reminder(std::string_view actor_type,
                                std::string_view actor_id,
                                std::string_view name) const;
  std::optional<Bytes> timer(std::string_view actor_type,
                             std::string_view actor_id,
                             std::string_view name) const;

 private:
  static Key make_key(std::string_view actor_type, std::string_view actor_id,
                      std::string_view name) {
    return Key(actor_type, actor_id, name);
  }

  static std::optional<Bytes> lookup(const std::map<Key, Bytes>& store,
                                     const Key& key);

  std::map<Key, Bytes> reminders;
  std::map<Key, Bytes> timers;
  std::map<Key, Bytes> state;
  mutable std::mutex mtx;
};

}  // namespace ActorHost::Client
