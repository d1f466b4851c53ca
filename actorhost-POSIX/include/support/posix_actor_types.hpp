#pragma once

#include <string_view>

#include "actors/counter_actor.hpp"
#include "actors/echo_actor.hpp"
#include "runtime/actor_runtime.hpp"
#include "support/logger.hpp"

namespace ActorHost::Support {

struct PosixActorTypes {
  // Registers one of the bundled actor types; false for unknown names.
  static bool register_actor_type(Runtime::ActorRuntime* runtime,
                                  std::string_view actor_type) {
    if (actor_type == Actors::CounterActor::TYPE_NAME) {
      runtime->register_actor<Actors::CounterActor>();
    } else if (actor_type == Actors::EchoActor::TYPE_NAME) {
      runtime->register_actor<Actors::EchoActor>();
    } else {
      Logger::warning("MAIN", "No bundled actor type named %.*s",
                      static_cast<int>(actor_type.size()), actor_type.data());
      return false;
    }
    return true;
  }
};

}  // namespace ActorHost::Support
