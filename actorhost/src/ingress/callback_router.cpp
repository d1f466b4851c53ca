#include "ingress/callback_router.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <utility>

#include "runtime/errors.hpp"
#include "serialization/msgpack_serializer.hpp"
#include "support/logger.hpp"
#include "support/string_helper.hpp"

namespace ActorHost::Ingress {

using Runtime::ActorRuntime;
using Serialization::Bytes;
using Serialization::Payload;

CallbackRouter::CallbackRouter(
    ActorRuntime* runtime,
    std::shared_ptr<const Serialization::Serializer> serializer)
    : runtime(runtime), serializer(std::move(serializer)) {
  if (this->runtime == nullptr) {
    throw std::invalid_argument("callback router requires an actor runtime");
  }
  if (!this->serializer) {
    this->serializer = Serialization::MsgPackSerializer::shared_instance();
  }
}

CallbackResponse CallbackRouter::handle(std::string_view http_method,
                                        std::string_view path,
                                        const Bytes& body) {
  auto segments = Support::StringHelper::string_split(
      Support::StringHelper::strip_prefix(path, '/'), "/",
      Support::StringHelper::EmptySegments::KEEP);
  for (std::string_view segment : segments) {
    if (segment.empty()) {
      return error(STATUS_BAD_REQUEST, "ERR_MALFORMED_REQUEST",
                   fmt::format("empty path segment in {}", path));
    }
  }

  if (segments.size() == 1 && segments[0] == "healthz") {
    if (http_method != "GET") {
      return error(STATUS_METHOD_NOT_ALLOWED, "ERR_METHOD_NOT_ALLOWED",
                   http_method);
    }
    return ok();
  }

  if (segments.size() == 2 && segments[0] == "dapr" &&
      segments[1] == "config") {
    if (http_method != "GET") {
      return error(STATUS_METHOD_NOT_ALLOWED, "ERR_METHOD_NOT_ALLOWED",
                   http_method);
    }
    return ok(serializer->serialize(runtime->actor_config()->to_payload()));
  }

  if (segments.size() >= 3 && segments[0] == "actors") {
    try {
      return route_actor_request(http_method, segments, body);
    } catch (const Runtime::ActorError& e) {
      Support::Logger::error("CALLBACK-ROUTER", "%s %.*s failed: %s",
                             std::string(http_method).c_str(),
                             static_cast<int>(path.size()), path.data(),
                             e.what());
      return error(STATUS_INTERNAL_ERROR, "ERR_ACTOR_RUNTIME", e.what());
    } catch (const std::invalid_argument& e) {
      return error(STATUS_BAD_REQUEST, "ERR_MALFORMED_REQUEST", e.what());
    } catch (const std::exception& e) {
      Support::Logger::error("CALLBACK-ROUTER", "%s %.*s failed: %s",
                             std::string(http_method).c_str(),
                             static_cast<int>(path.size()), path.data(),
                             e.what());
      return error(STATUS_INTERNAL_ERROR, "ERR_ACTOR_INVOKE_METHOD", e.what());
    }
  }

  return error(STATUS_NOT_FOUND, "ERR_ROUTE_NOT_FOUND", path);
}

CallbackResponse CallbackRouter::route_actor_request(
    std::string_view http_method, const std::vector<std::string_view>& segments,
    const Bytes& body) {
  std::string_view actor_type = segments[1];
  std::string_view actor_id = segments[2];

  if (segments.size() == 3) {
    if (http_method == "POST") {
      return routing_result(runtime->activate(actor_type, actor_id), actor_type,
                            Bytes());
    } else if (http_method == "DELETE") {
      return routing_result(runtime->deactivate(actor_type, actor_id),
                            actor_type, Bytes());
    }
    return error(STATUS_METHOD_NOT_ALLOWED, "ERR_METHOD_NOT_ALLOWED",
                 http_method);
  }

  if (segments[3] != "method" || segments.size() < 5 || segments.size() > 6) {
    return error(STATUS_NOT_FOUND, "ERR_ROUTE_NOT_FOUND",
                 fmt::format("unknown actor route for {}", actor_type));
  }
  if (http_method != "PUT") {
    return error(STATUS_METHOD_NOT_ALLOWED, "ERR_METHOD_NOT_ALLOWED",
                 http_method);
  }

  if (segments.size() == 5) {
    auto [result, response] =
        runtime->dispatch(actor_type, actor_id, segments[4], body);
    return routing_result(result, actor_type, std::move(response));
  } else if (segments[4] == "remind") {
    return routing_result(
        runtime->fire_reminder(actor_type, actor_id, segments[5], body),
        actor_type, Bytes());
  } else if (segments[4] == "timer") {
    return routing_result(
        runtime->fire_timer(actor_type, actor_id, segments[5]), actor_type,
        Bytes());
  }
  return error(STATUS_NOT_FOUND, "ERR_ROUTE_NOT_FOUND",
               fmt::format("unknown actor route for {}", actor_type));
}

CallbackResponse CallbackRouter::ok(Bytes body) const {
  return CallbackResponse{STATUS_OK, std::move(body),
                          std::string(serializer->content_type())};
}

CallbackResponse CallbackRouter::error(int status, std::string_view error_code,
                                       std::string_view message) const {
  Payload payload;
  payload.set_attr("errorCode", error_code);
  payload.set_attr("message", message);
  return CallbackResponse{status, serializer->serialize(payload),
                          std::string(serializer->content_type())};
}

CallbackResponse CallbackRouter::routing_result(
    ActorRuntime::RoutingResult result, std::string_view actor_type,
    Bytes body) const {
  if (result == ActorRuntime::RoutingResult::UNKNOWN_ACTOR_TYPE) {
    return error(STATUS_NOT_FOUND, "ERR_ACTOR_TYPE_NOT_FOUND",
                 fmt::format("actor type {} is not registered", actor_type));
  }
  return ok(std::move(body));
}

}  // namespace ActorHost::Ingress
