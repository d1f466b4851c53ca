#include "runtime/actor_manager.hpp"

#include <fmt/format.h>

#include <chrono>
#include <stdexcept>
#include <utility>

#include "runtime/errors.hpp"
#include "support/duration_format.hpp"
#include "support/logger.hpp"

namespace ActorHost::Runtime {

using Serialization::Bytes;
using Serialization::Payload;

ActorManager::ActorManager(
    std::shared_ptr<ActorRuntimeContext> runtime_context)
    : _runtime_context(std::move(runtime_context)) {
  if (!_runtime_context) {
    throw std::invalid_argument("actor manager requires a runtime context");
  }
}

void ActorManager::activate_actor(const ActorId& actor_id) {
  auto actor = create_activated_actor(actor_id);
  std::unique_lock lck(active_actors_mtx);
  active_actors.insert_or_assign(actor_id, std::move(actor));
}

void ActorManager::deactivate_actor(const ActorId& actor_id) {
  std::shared_ptr<Actor> actor;
  {
    std::unique_lock lck(active_actors_mtx);
    auto it = active_actors.find(actor_id);
    if (it == active_actors.end()) {
      throw ActorNotActivatedError(
          fmt::format("{} is not activated", actor_id.id()));
    }
    actor = std::move(it->second);
    active_actors.erase(it);
  }
  std::unique_lock turn(actor->turn_mtx);
  actor->on_deactivate();
  Support::Logger::debug("ACTOR-MANAGER", "Deactivated %s/%s",
                         _runtime_context->type_info().type_name().c_str(),
                         actor_id.id().c_str());
}

Bytes ActorManager::dispatch(const ActorId& actor_id,
                             std::string_view method_name,
                             const Bytes& request_body) {
  const auto& type_info = _runtime_context->type_info();
  const auto* invoker = type_info.method_table().find(method_name);
  if (invoker == nullptr) {
    throw ActorMethodNotFoundError(fmt::format(
        "method {} is not defined in {}", method_name, type_info.type_name()));
  }
  Payload arguments = decode_body(request_body, "method arguments");

  auto actor = activated_actor(actor_id);
  Payload result;
  {
    std::unique_lock turn(actor->turn_mtx);
    actor->on_pre_actor_method(method_name);
    result = (*invoker)(actor.get(), arguments);
    actor->on_post_actor_method(method_name);
  }
  return _runtime_context->message_serializer().serialize(result);
}

void ActorManager::fire_reminder(const ActorId& actor_id,
                                 std::string_view name,
                                 const Bytes& request_body) {
  const auto& type_info = _runtime_context->type_info();
  if (!type_info.is_remindable()) {
    throw ActorNotRemindableError(fmt::format(
        "{} does not implement Remindable", type_info.type_name()));
  }
  Payload reminder = decode_body(request_body, "reminder data");

  Payload state;
  if (auto data = reminder.get_nested_component("data"); data && *data) {
    state = **data;
  }
  auto due_time = std::chrono::milliseconds(0);
  if (auto raw = reminder.get_str_attr("dueTime")) {
    auto parsed = Support::DurationFormat::parse(*raw);
    if (!parsed) {
      throw PayloadFormatError(
          fmt::format("invalid reminder due time \"{}\"", *raw));
    }
    due_time = *parsed;
  }
  auto period = std::chrono::milliseconds(0);
  if (auto raw = reminder.get_str_attr("period")) {
    auto parsed = Support::DurationFormat::parse(*raw);
    if (!parsed) {
      throw PayloadFormatError(
          fmt::format("invalid reminder period \"{}\"", *raw));
    }
    period = *parsed;
  }

  auto actor = activated_actor(actor_id);
  auto* remindable = dynamic_cast<Remindable*>(actor.get());
  if (remindable == nullptr) {
    throw ActorNotRemindableError(fmt::format(
        "{} does not implement Remindable", type_info.type_name()));
  }
  std::unique_lock turn(actor->turn_mtx);
  remindable->receive_reminder(name, state, due_time, period);
}

void ActorManager::fire_timer(const ActorId& actor_id, std::string_view name) {
  auto actor = activated_actor(actor_id);
  std::unique_lock turn(actor->turn_mtx);
  if (!actor->fire_timer(name)) {
    throw ActorTimerNotFoundError(
        fmt::format("timer {} is not registered for {}", name, actor_id.id()));
  }
}

bool ActorManager::is_active(const ActorId& actor_id) const {
  std::unique_lock lck(active_actors_mtx);
  return active_actors.find(actor_id) != active_actors.end();
}

size_t ActorManager::active_actor_count() const {
  std::unique_lock lck(active_actors_mtx);
  return active_actors.size();
}

std::shared_ptr<Actor> ActorManager::create_activated_actor(
    const ActorId& actor_id) {
  std::shared_ptr<Actor> actor = _runtime_context->create_actor(actor_id);
  if (!actor) {
    throw ActorError(fmt::format("could not construct {}/{}",
                                 _runtime_context->type_info().type_name(),
                                 actor_id.id()));
  }
  {
    std::unique_lock turn(actor->turn_mtx);
    actor->on_activate();
  }
  Support::Logger::debug("ACTOR-MANAGER", "Activated %s/%s",
                         _runtime_context->type_info().type_name().c_str(),
                         actor_id.id().c_str());
  return actor;
}

std::shared_ptr<Actor> ActorManager::activated_actor(const ActorId& actor_id) {
  {
    std::unique_lock lck(active_actors_mtx);
    auto it = active_actors.find(actor_id);
    if (it != active_actors.end()) {
      return it->second;
    }
  }
  auto actor = create_activated_actor(actor_id);
  std::unique_lock lck(active_actors_mtx);
  // A concurrent first call may have won the race; keep its instance.
  return active_actors.try_emplace(actor_id, std::move(actor)).first->second;
}

Payload ActorManager::decode_body(const Bytes& body,
                                  std::string_view purpose) const {
  if (body.empty()) {
    return Payload();
  }
  auto decoded = _runtime_context->message_serializer().deserialize(body);
  if (!decoded) {
    throw PayloadFormatError(fmt::format("{} of {} could not be decoded",
                                         purpose,
                                         _runtime_context->type_info().type_name()));
  }
  return std::move(*decoded);
}

}  // namespace ActorHost::Runtime
