#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "runtime/actor_runtime.hpp"
#include "serialization/serializer.hpp"

namespace ActorHost::Ingress {

struct CallbackResponse {
  int status;
  Serialization::Bytes body;
  std::string content_type;
};

/*
 * Translates the sidecar's actor callbacks into ActorRuntime calls:
 *
 *   GET    /healthz
 *   GET    /dapr/config
 *   POST   /actors/<type>/<id>                      activate
 *   DELETE /actors/<type>/<id>                      deactivate
 *   PUT    /actors/<type>/<id>/method/<method>      dispatch
 *   PUT    /actors/<type>/<id>/method/remind/<name> fire reminder
 *   PUT    /actors/<type>/<id>/method/timer/<name>  fire timer
 *
 * Unknown actor types answer 404, paths with empty segments 400 and handler
 * failures 500. Error bodies carry
 * errorCode and message, encoded with the router's serializer.
 */
class CallbackRouter {
 public:
  constexpr static int STATUS_OK = 200;
  constexpr static int STATUS_BAD_REQUEST = 400;
  constexpr static int STATUS_NOT_FOUND = 404;
  constexpr static int STATUS_METHOD_NOT_ALLOWED = 405;
  constexpr static int STATUS_INTERNAL_ERROR = 500;

  explicit CallbackRouter(
      Runtime::ActorRuntime* runtime,
      std::shared_ptr<const Serialization::Serializer> serializer = nullptr);

  CallbackResponse handle(std::string_view http_method, std::string_view path,
                          const Serialization::Bytes& body);

 private:
  CallbackResponse route_actor_request(
      std::string_view http_method,
      const std::vector<std::string_view>& segments,
      const Serialization::Bytes& body);

  CallbackResponse ok(Serialization::Bytes body = Serialization::Bytes()) const;
  CallbackResponse error(int status, std::string_view error_code,
                         std::string_view message) const;
  CallbackResponse routing_result(Runtime::ActorRuntime::RoutingResult result,
                                  std::string_view actor_type,
                                  Serialization::Bytes body) const;

  Runtime::ActorRuntime* runtime;
  std::shared_ptr<const Serialization::Serializer> serializer;
};

}  // namespace ActorHost::Ingress
