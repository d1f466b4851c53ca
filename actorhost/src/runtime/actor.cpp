#include "runtime/actor.hpp"

#include "runtime/actor_runtime_context.hpp"
#include "runtime/errors.hpp"
#include "support/duration_format.hpp"

namespace ActorHost::Runtime {

using Serialization::Payload;

Actor::Actor(ActorRuntimeContext* runtime_context, ActorId actor_id)
    : _runtime_context(runtime_context), _id(std::move(actor_id)) {}

void Actor::register_timer(std::string name, TimerCallback callback,
                           Payload state, std::chrono::milliseconds due_time,
                           std::chrono::milliseconds period) {
  Payload request;
  request.set_attr("dueTime", Support::DurationFormat::to_string(due_time));
  request.set_attr("period", Support::DurationFormat::to_string(period));
  request.set_attr("callback", std::string_view(name));
  _runtime_context->sidecar_client().register_timer(
      _runtime_context->type_info().type_name(), _id.id(), name,
      _runtime_context->message_serializer().serialize(request));

  timers.insert_or_assign(std::move(name),
                          Timer{std::move(callback), std::move(state)});
}

void Actor::unregister_timer(std::string_view name) {
  _runtime_context->sidecar_client().unregister_timer(
      _runtime_context->type_info().type_name(), _id.id(), name);
  auto it = timers.find(std::string(name));
  if (it != timers.end()) {
    timers.erase(it);
  }
}

void Actor::register_reminder(std::string_view name, const Payload& state,
                              std::chrono::milliseconds due_time,
                              std::chrono::milliseconds period) {
  Payload request;
  request.set_attr("dueTime", Support::DurationFormat::to_string(due_time));
  request.set_attr("period", Support::DurationFormat::to_string(period));
  request.set_attr("data", std::make_shared<Payload>(state));
  _runtime_context->sidecar_client().register_reminder(
      _runtime_context->type_info().type_name(), _id.id(), name,
      _runtime_context->message_serializer().serialize(request));
}

void Actor::unregister_reminder(std::string_view name) {
  _runtime_context->sidecar_client().unregister_reminder(
      _runtime_context->type_info().type_name(), _id.id(), name);
}

void Actor::save_state(std::string_view key, const Payload& value) {
  _runtime_context->sidecar_client().save_state(
      _runtime_context->type_info().type_name(), _id.id(), key,
      _runtime_context->state_serializer().serialize(value));
}

std::optional<Payload> Actor::load_state(std::string_view key) {
  auto raw = _runtime_context->sidecar_client().get_state(
      _runtime_context->type_info().type_name(), _id.id(), key);
  if (!raw) {
    return std::nullopt;
  }
  auto value = _runtime_context->state_serializer().deserialize(*raw);
  if (!value) {
    throw PayloadFormatError("state " + std::string(key) + " of " + _id.id() +
                             " could not be decoded");
  }
  return value;
}

void Actor::remove_state(std::string_view key) {
  _runtime_context->sidecar_client().delete_state(
      _runtime_context->type_info().type_name(), _id.id(), key);
}

bool Actor::fire_timer(std::string_view name) {
  auto it = timers.find(std::string(name));
  if (it == timers.end()) {
    return false;
  }
  // The callback may unregister its own timer.
  Timer timer = it->second;
  timer.callback(this, timer.state);
  return true;
}

}  // namespace ActorHost::Runtime
