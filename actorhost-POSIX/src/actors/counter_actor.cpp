#include "actors/counter_actor.hpp"

#include <fmt/format.h>

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <utility>

#include "runtime/actor_runtime_context.hpp"
#include "support/logger.hpp"

namespace ActorHost::Actors {

using Serialization::Payload;

CounterActor::CounterActor(Runtime::ActorRuntimeContext* runtime_context,
                           Runtime::ActorId actor_id)
    : Runtime::Actor(runtime_context, std::move(actor_id)) {}

void CounterActor::define_methods(Runtime::ActorMethodTable* table) {
  table->add("increment", &CounterActor::increment);
  table->add("get", &CounterActor::get);
  table->add("reset", &CounterActor::reset);
  table->add("schedule", &CounterActor::schedule);
}

void CounterActor::on_activate() {
  if (auto stored = load_state("counter")) {
    value = stored->get_int_attr("value").value_or(0);
  }
}

Payload CounterActor::increment(const Payload& arguments) {
  add(arguments.get_int_attr("amount").value_or(1));
  return value_payload();
}

Payload CounterActor::get(const Payload& /*arguments*/) {
  return value_payload();
}

Payload CounterActor::reset(const Payload& /*arguments*/) {
  value = 0;
  remove_state("counter");
  return value_payload();
}

Payload CounterActor::schedule(const Payload& arguments) {
  auto name = arguments.get_str_attr("name");
  Payload result;
  if (!name) {
    result.set_attr("scheduled", false);
    return result;
  }
  auto due_time =
      std::chrono::milliseconds(arguments.get_int_attr("due_ms").value_or(0));
  auto period =
      std::chrono::milliseconds(arguments.get_int_attr("period_ms").value_or(0));

  if (arguments.get_str_attr("kind").value_or("timer") == "reminder") {
    register_reminder(*name, Payload(), due_time, period);
  } else {
    register_timer(
        std::string(*name),
        [](Runtime::Actor* actor, const Payload& /*state*/) {
          static_cast<CounterActor*>(actor)->add(1);
        },
        Payload(), due_time, period);
  }
  result.set_attr("scheduled", true);
  return result;
}

void CounterActor::receive_reminder(std::string_view name,
                                    const Payload& /*state*/,
                                    std::chrono::milliseconds /*due_time*/,
                                    std::chrono::milliseconds /*period*/) {
  Support::Logger::debug("COUNTER", "Reminder %.*s for %s",
                         static_cast<int>(name.size()), name.data(),
                         id().id().c_str());
  add(1);
}

void CounterActor::add(int32_t amount) {
  int64_t sum = static_cast<int64_t>(value) + amount;
  if (sum > std::numeric_limits<int32_t>::max() ||
      sum < std::numeric_limits<int32_t>::min()) {
    throw std::invalid_argument(
        fmt::format("counter {} cannot add {} to {}", id().id(), amount, value));
  }
  value = static_cast<int32_t>(sum);
  Payload stored;
  stored.set_attr("value", value);
  save_state("counter", stored);
}

Payload CounterActor::value_payload() const {
  Payload result;
  result.set_attr("value", value);
  return result;
}

}  // namespace ActorHost::Actors
