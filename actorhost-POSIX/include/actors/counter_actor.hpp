#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>

#include "runtime/actor.hpp"
#include "runtime/actor_method_table.hpp"
#include "serialization/payload.hpp"

namespace ActorHost::Actors {

/*
 * Keeps a persisted counter. Methods:
 *   increment {amount?}  -> {value}
 *   get                  -> {value}
 *   reset                -> {value}
 *   schedule {name, due_ms?, period_ms?, kind="timer"|"reminder"}
 * Timers and reminders increment the counter by one when they fire.
 * Additions that leave the int32 range throw std::invalid_argument.
 */
class CounterActor : public Runtime::Actor, public Runtime::Remindable {
 public:
  constexpr static std::string_view TYPE_NAME = "Counter";

  CounterActor(Runtime::ActorRuntimeContext* runtime_context,
               Runtime::ActorId actor_id);

  static void define_methods(Runtime::ActorMethodTable* table);

  void on_activate() override;

  Serialization::Payload increment(const Serialization::Payload& arguments);
  Serialization::Payload get(const Serialization::Payload& arguments);
  Serialization::Payload reset(const Serialization::Payload& arguments);
  Serialization::Payload schedule(const Serialization::Payload& arguments);

  void receive_reminder(std::string_view name,
                        const Serialization::Payload& state,
                        std::chrono::milliseconds due_time,
                        std::chrono::milliseconds period) override;

 private:
  void add(int32_t amount);
  Serialization::Payload value_payload() const;

  int32_t value = 0;
};

}  // namespace ActorHost::Actors
