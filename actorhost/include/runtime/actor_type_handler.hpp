#pragma once

#include <string_view>

#include "runtime/actor_id.hpp"
#include "serialization/payload.hpp"

namespace ActorHost::Runtime {

// Lifecycle and invocation for all actors of one type. Failures are reported
// by throwing; callers see them unchanged.
struct ActorTypeHandler {
  virtual void activate_actor(const ActorId& actor_id) = 0;
  virtual void deactivate_actor(const ActorId& actor_id) = 0;

  // Request and response bodies are opaque to everything above the handler.
  virtual Serialization::Bytes dispatch(
      const ActorId& actor_id, std::string_view method_name,
      const Serialization::Bytes& request_body) = 0;

  virtual void fire_reminder(const ActorId& actor_id, std::string_view name,
                             const Serialization::Bytes& request_body) = 0;
  virtual void fire_timer(const ActorId& actor_id, std::string_view name) = 0;

  virtual ~ActorTypeHandler() = default;
};

}  // namespace ActorHost::Runtime
