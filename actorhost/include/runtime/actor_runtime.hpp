#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "client/sidecar_client.hpp"
#include "runtime/actor_runtime_config.hpp"
#include "runtime/actor_runtime_context.hpp"
#include "runtime/actor_type_handler.hpp"
#include "runtime/actor_type_information.hpp"
#include "serialization/serializer.hpp"

namespace ActorHost::Runtime {

/*
 * Registry of the actor types hosted by this process and router for all
 * per-actor requests. Each routing call resolves the handler of the type
 * under the registry lock and then delegates outside of it; handler
 * failures surface to the caller unchanged.
 *
 * One instance is created by the hosting process and handed to the request
 * layer.
 */
class ActorRuntime {
 public:
  enum class RoutingResult { OK = 0, UNKNOWN_ACTOR_TYPE };

  using ClientFactory = std::function<std::shared_ptr<Client::SidecarClient>()>;
  using HandlerFactory = std::function<std::shared_ptr<ActorTypeHandler>(
      std::shared_ptr<ActorRuntimeContext> runtime_context)>;

  // Uses LocalSidecarClient and ActorManager for every registration.
  ActorRuntime();
  explicit ActorRuntime(std::shared_ptr<ActorRuntimeConfig> config);
  ActorRuntime(std::shared_ptr<ActorRuntimeConfig> config,
               ClientFactory client_factory, HandlerFactory handler_factory);

  ActorRuntime(const ActorRuntime&) = delete;
  ActorRuntime& operator=(const ActorRuntime&) = delete;

  // Installs a new handler for the type, replacing an earlier registration
  // of the same name. Nothing changes if building the handler throws.
  void register_actor(ActorTypeInformation type_info,
                      Serialization::SerializerConfiguration serializers =
                          Serialization::SerializerConfiguration::defaults());

  template <typename T>
  void register_actor(Serialization::SerializerConfiguration serializers =
                          Serialization::SerializerConfiguration::defaults()) {
    register_actor(ActorTypeInformation::create<T>(), std::move(serializers));
  }

  [[nodiscard]] std::vector<std::string> registered_actor_types() const;

  // nullptr if the type is not registered.
  [[nodiscard]] std::shared_ptr<ActorTypeHandler> route(
      std::string_view actor_type_name) const;

  RoutingResult activate(std::string_view actor_type_name,
                         std::string_view actor_id);

  RoutingResult deactivate(std::string_view actor_type_name,
                           std::string_view actor_id);

  // The response bytes are empty unless the result is OK.
  std::pair<RoutingResult, Serialization::Bytes> dispatch(
      std::string_view actor_type_name, std::string_view actor_id,
      std::string_view actor_method_name,
      const Serialization::Bytes& request_body);

  RoutingResult fire_reminder(std::string_view actor_type_name,
                              std::string_view actor_id, std::string_view name,
                              const Serialization::Bytes& request_body);

  RoutingResult fire_timer(std::string_view actor_type_name,
                           std::string_view actor_id, std::string_view name);

  // Replaces the config object; its entity list is rewritten from the
  // registry before this returns.
  void set_actor_config(std::shared_ptr<ActorRuntimeConfig> config);

  // The live, shared config object.
  [[nodiscard]] std::shared_ptr<ActorRuntimeConfig> actor_config() const;

  static const char* routing_result_name(RoutingResult result);

 private:
  std::vector<std::string> registered_actor_types_locked() const;

  ClientFactory client_factory;
  HandlerFactory handler_factory;

  std::map<std::string, std::shared_ptr<ActorTypeHandler>, std::less<>>
      actor_handlers;
  std::shared_ptr<ActorRuntimeConfig> _actor_config;
  mutable std::mutex actor_handlers_mtx;
};

}  // namespace ActorHost::Runtime
