#pragma once

#include <string_view>
#include <utility>

#include "runtime/actor.hpp"
#include "runtime/actor_method_table.hpp"
#include "serialization/payload.hpp"

namespace ActorHost::Actors {

class EchoActor : public Runtime::Actor {
 public:
  constexpr static std::string_view TYPE_NAME = "Echo";

  EchoActor(Runtime::ActorRuntimeContext* runtime_context,
            Runtime::ActorId actor_id)
      : Runtime::Actor(runtime_context, std::move(actor_id)) {}

  static void define_methods(Runtime::ActorMethodTable* table) {
    table->add("echo", &EchoActor::echo);
  }

  Serialization::Payload echo(const Serialization::Payload& arguments) {
    return arguments;
  }
};

}  // namespace ActorHost::Actors
