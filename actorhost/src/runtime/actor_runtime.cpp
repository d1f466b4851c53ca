#include "runtime/actor_runtime.hpp"

#include <stdexcept>

#include "client/local_sidecar_client.hpp"
#include "runtime/actor_id.hpp"
#include "runtime/actor_manager.hpp"
#include "support/logger.hpp"

namespace ActorHost::Runtime {

ActorRuntime::ActorRuntime()
    : ActorRuntime(std::make_shared<ActorRuntimeConfig>()) {}

ActorRuntime::ActorRuntime(std::shared_ptr<ActorRuntimeConfig> config)
    : ActorRuntime(
          std::move(config),
          []() { return std::make_shared<Client::LocalSidecarClient>(); },
          [](std::shared_ptr<ActorRuntimeContext> runtime_context) {
            return std::make_shared<ActorManager>(std::move(runtime_context));
          }) {}

ActorRuntime::ActorRuntime(std::shared_ptr<ActorRuntimeConfig> config,
                           ClientFactory client_factory,
                           HandlerFactory handler_factory)
    : client_factory(std::move(client_factory)),
      handler_factory(std::move(handler_factory)),
      _actor_config(std::move(config)) {
  if (!_actor_config || !this->client_factory || !this->handler_factory) {
    throw std::invalid_argument(
        "actor runtime requires a config, a client factory and a handler "
        "factory");
  }
}

void ActorRuntime::register_actor(
    ActorTypeInformation type_info,
    Serialization::SerializerConfiguration serializers) {
  std::string type_name = type_info.type_name();

  // Build everything before taking the lock so that a failure leaves the
  // registry untouched.
  auto sidecar_client = client_factory();
  auto runtime_context = std::make_shared<ActorRuntimeContext>(
      std::move(type_info), std::move(serializers), std::move(sidecar_client));
  auto handler = handler_factory(std::move(runtime_context));
  if (!handler) {
    throw std::runtime_error("no handler was built for actor type " +
                             type_name);
  }

  std::unique_lock lck(actor_handlers_mtx);
  actor_handlers.insert_or_assign(type_name, std::move(handler));
  _actor_config->update_entities(registered_actor_types_locked());
  Support::Logger::info("ACTOR-RUNTIME", "Registered actor type %s",
                        type_name.c_str());
}

std::vector<std::string> ActorRuntime::registered_actor_types() const {
  std::unique_lock lck(actor_handlers_mtx);
  return registered_actor_types_locked();
}

std::shared_ptr<ActorTypeHandler> ActorRuntime::route(
    std::string_view actor_type_name) const {
  std::unique_lock lck(actor_handlers_mtx);
  auto it = actor_handlers.find(actor_type_name);
  if (it == actor_handlers.end()) {
    Support::Logger::warning("ACTOR-RUNTIME", "Unknown actor type %.*s",
                             static_cast<int>(actor_type_name.size()),
                             actor_type_name.data());
    return nullptr;
  }
  return it->second;
}

ActorRuntime::RoutingResult ActorRuntime::activate(
    std::string_view actor_type_name, std::string_view actor_id) {
  auto handler = route(actor_type_name);
  if (!handler) {
    return RoutingResult::UNKNOWN_ACTOR_TYPE;
  }
  handler->activate_actor(ActorId(std::string(actor_id)));
  return RoutingResult::OK;
}

ActorRuntime::RoutingResult ActorRuntime::deactivate(
    std::string_view actor_type_name, std::string_view actor_id) {
  auto handler = route(actor_type_name);
  if (!handler) {
    return RoutingResult::UNKNOWN_ACTOR_TYPE;
  }
  handler->deactivate_actor(ActorId(std::string(actor_id)));
  return RoutingResult::OK;
}

std::pair<ActorRuntime::RoutingResult, Serialization::Bytes>
ActorRuntime::dispatch(std::string_view actor_type_name,
                       std::string_view actor_id,
                       std::string_view actor_method_name,
                       const Serialization::Bytes& request_body) {
  auto handler = route(actor_type_name);
  if (!handler) {
    return {RoutingResult::UNKNOWN_ACTOR_TYPE, Serialization::Bytes()};
  }
  return {RoutingResult::OK,
          handler->dispatch(ActorId(std::string(actor_id)), actor_method_name,
                            request_body)};
}

ActorRuntime::RoutingResult ActorRuntime::fire_reminder(
    std::string_view actor_type_name, std::string_view actor_id,
    std::string_view name, const Serialization::Bytes& request_body) {
  auto handler = route(actor_type_name);
  if (!handler) {
    return RoutingResult::UNKNOWN_ACTOR_TYPE;
  }
  handler->fire_reminder(ActorId(std::string(actor_id)), name, request_body);
  return RoutingResult::OK;
}

ActorRuntime::RoutingResult ActorRuntime::fire_timer(
    std::string_view actor_type_name, std::string_view actor_id,
    std::string_view name) {
  auto handler = route(actor_type_name);
  if (!handler) {
    return RoutingResult::UNKNOWN_ACTOR_TYPE;
  }
  handler->fire_timer(ActorId(std::string(actor_id)), name);
  return RoutingResult::OK;
}

void ActorRuntime::set_actor_config(std::shared_ptr<ActorRuntimeConfig> config) {
  if (!config) {
    throw std::invalid_argument("actor runtime config must not be null");
  }
  std::unique_lock lck(actor_handlers_mtx);
  _actor_config = std::move(config);
  _actor_config->update_entities(registered_actor_types_locked());
}

std::shared_ptr<ActorRuntimeConfig> ActorRuntime::actor_config() const {
  std::unique_lock lck(actor_handlers_mtx);
  return _actor_config;
}

const char* ActorRuntime::routing_result_name(RoutingResult result) {
  switch (result) {
    case RoutingResult::OK:
      return "OK";
    case RoutingResult::UNKNOWN_ACTOR_TYPE:
      return "UNKNOWN_ACTOR_TYPE";
  }
  return "INVALID";
}

std::vector<std::string> ActorRuntime::registered_actor_types_locked() const {
  std::vector<std::string> actor_types;
  actor_types.reserve(actor_handlers.size());
  for (const auto& [actor_type, _] : actor_handlers) {
    actor_types.push_back(actor_type);
  }
  return actor_types;
}

}  // namespace ActorHost::Runtime
