#pragma once

#include <optional>
#include <string_view>

#include "serialization/payload.hpp"

namespace ActorHost::Client {

using Serialization::Bytes;

// Handle used by actor type handlers to reach the actor-hosting sidecar.
// Request bodies are already encoded with the type's message or state
// serializer.
struct SidecarClient {
  virtual void register_reminder(std::string_view actor_type,
                                 std::string_view actor_id,
                                 std::string_view name, const Bytes& data) = 0;
  virtual void unregister_reminder(std::string_view actor_type,
                                   std::string_view actor_id,
                                   std::string_view name) = 0;
  virtual void register_timer(std::string_view actor_type,
                              std::string_view actor_id, std::string_view name,
                              const Bytes& data) = 0;
  virtual void unregister_timer(std::string_view actor_type,
                                std::string_view actor_id,
                                std::string_view name) = 0;

  virtual void save_state(std::string_view actor_type,
                          std::string_view actor_id, std::string_view key,
                          const Bytes& value) = 0;
  virtual std::optional<Bytes> get_state(std::string_view actor_type,
                                         std::string_view actor_id,
                                         std::string_view key) = 0;
  virtual void delete_state(std::string_view actor_type,
                            std::string_view actor_id,
                            std::string_view key) = 0;

  virtual ~SidecarClient() = default;
};

}  // namespace ActorHost::Client
