#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "actors/counter_actor.hpp"
#include "actors/echo_actor.hpp"
#include "ingress/callback_router.hpp"
#include "runtime/actor_runtime.hpp"
#include "serialization/msgpack_serializer.hpp"
#include "support/string_helper.hpp"
#include "test_handlers.hpp"

namespace ActorHost::Test {

using Ingress::CallbackResponse;
using Ingress::CallbackRouter;
using Serialization::MsgPackSerializer;
using Serialization::Payload;

struct RouterFixture {
  RouterFixture() : router(&runtime) {
    runtime.register_actor<Actors::CounterActor>();
    runtime.register_actor<Actors::EchoActor>();
  }

  Payload decode(const CallbackResponse& response) {
    auto decoded =
        MsgPackSerializer::shared_instance()->deserialize(response.body);
    if (!decoded) {
      throw std::runtime_error("undecodable response body");
    }
    return *decoded;
  }

  CallbackResponse put(std::string_view path, const Payload& body) {
    return router.handle("PUT", path,
                         MsgPackSerializer::shared_instance()->serialize(body));
  }

  Runtime::ActorRuntime runtime;
  CallbackRouter router;
};

TEST(STRINGHELPER, split) {
  auto segments =
      Support::StringHelper::string_split("/actors/Counter/1/method/get", "/");
  ASSERT_EQ(segments, (std::vector<std::string_view>{"actors", "Counter", "1",
                                                     "method", "get"}));
  ASSERT_EQ(Support::StringHelper::string_split("Counter,,Echo,"),
            (std::vector<std::string_view>{"Counter", "Echo"}));
  ASSERT_TRUE(Support::StringHelper::string_split("").empty());
}

TEST(STRINGHELPER, split_keeps_empty_segments) {
  using Support::StringHelper;
  ASSERT_EQ(StringHelper::string_split("a//b/", "/",
                                       StringHelper::EmptySegments::KEEP),
            (std::vector<std::string_view>{"a", "", "b", ""}));
  ASSERT_EQ(
      StringHelper::string_split("", "/", StringHelper::EmptySegments::KEEP),
      std::vector<std::string_view>{""});
  ASSERT_EQ(StringHelper::strip_prefix("/healthz", '/'), "healthz");
  ASSERT_EQ(StringHelper::strip_prefix("healthz", '/'), "healthz");
}

TEST(CALLBACKROUTER, healthz) {
  RouterFixture f;
  auto response = f.router.handle("GET", "/healthz", Bytes());
  ASSERT_EQ(response.status, CallbackRouter::STATUS_OK);
  ASSERT_TRUE(response.body.empty());
  ASSERT_EQ(f.router.handle("POST", "/healthz", Bytes()).status,
            CallbackRouter::STATUS_METHOD_NOT_ALLOWED);
}

TEST(CALLBACKROUTER, config_lists_registered_types) {
  RouterFixture f;
  auto response = f.router.handle("GET", "/dapr/config", Bytes());
  ASSERT_EQ(response.status, CallbackRouter::STATUS_OK);
  ASSERT_EQ(response.content_type, "application/msgpack");

  auto config = f.decode(response);
  ASSERT_EQ(*config.get_string_list_attr("entities"),
            (std::vector<std::string>{"Counter", "Echo"}));
  ASSERT_EQ(config.get_str_attr("actorIdleTimeout"), "1h0m0s");
}

TEST(CALLBACKROUTER, actor_lifecycle) {
  RouterFixture f;
  ASSERT_EQ(f.router.handle("POST", "/actors/Counter/c1", Bytes()).status,
            CallbackRouter::STATUS_OK);

  Payload arguments;
  arguments.set_attr("amount", 2);
  auto response = f.put("/actors/Counter/c1/method/increment", arguments);
  ASSERT_EQ(response.status, CallbackRouter::STATUS_OK);
  ASSERT_EQ(f.decode(response).get_int_attr("value"), 2);

  ASSERT_EQ(f.router.handle("DELETE", "/actors/Counter/c1", Bytes()).status,
            CallbackRouter::STATUS_OK);

  auto again = f.router.handle("DELETE", "/actors/Counter/c1", Bytes());
  ASSERT_EQ(again.status, CallbackRouter::STATUS_INTERNAL_ERROR);
  ASSERT_EQ(f.decode(again).get_str_attr("errorCode"), "ERR_ACTOR_RUNTIME");
}

TEST(CALLBACKROUTER, echo) {
  RouterFixture f;
  Payload arguments;
  arguments.set_attr("text", "hello");
  auto response = f.put("/actors/Echo/e1/method/echo", arguments);
  ASSERT_EQ(response.status, CallbackRouter::STATUS_OK);
  ASSERT_EQ(f.decode(response), arguments);
}

TEST(CALLBACKROUTER, timers_and_reminders) {
  RouterFixture f;
  Payload timer;
  timer.set_attr("name", "tick");
  timer.set_attr("kind", "timer");
  ASSERT_EQ(f.put("/actors/Counter/c1/method/schedule", timer).status,
            CallbackRouter::STATUS_OK);

  ASSERT_EQ(
      f.router.handle("PUT", "/actors/Counter/c1/method/timer/tick", Bytes())
          .status,
      CallbackRouter::STATUS_OK);
  ASSERT_EQ(
      f.router.handle("PUT", "/actors/Counter/c1/method/remind/daily", Bytes())
          .status,
      CallbackRouter::STATUS_OK);

  auto value = f.router.handle("PUT", "/actors/Counter/c1/method/get", Bytes());
  ASSERT_EQ(f.decode(value).get_int_attr("value"), 2);

  auto missing_timer =
      f.router.handle("PUT", "/actors/Counter/c1/method/timer/none", Bytes());
  ASSERT_EQ(missing_timer.status, CallbackRouter::STATUS_INTERNAL_ERROR);
}

TEST(CALLBACKROUTER, counter_overflow_is_rejected) {
  RouterFixture f;
  Payload arguments;
  arguments.set_attr("amount", std::numeric_limits<int32_t>::max());
  ASSERT_EQ(f.put("/actors/Counter/c1/method/increment", arguments).status,
            CallbackRouter::STATUS_OK);

  auto overflow = f.put("/actors/Counter/c1/method/increment", arguments);
  ASSERT_EQ(overflow.status, CallbackRouter::STATUS_BAD_REQUEST);
  ASSERT_EQ(f.decode(overflow).get_str_attr("errorCode"),
            "ERR_MALFORMED_REQUEST");

  auto value = f.router.handle("PUT", "/actors/Counter/c1/method/get", Bytes());
  ASSERT_EQ(f.decode(value).get_int_attr("value"),
            std::numeric_limits<int32_t>::max());

  arguments.set_attr("amount", std::numeric_limits<int32_t>::min());
  auto back = f.put("/actors/Counter/c1/method/increment", arguments);
  ASSERT_EQ(f.decode(back).get_int_attr("value"), -1);
}

TEST(CALLBACKROUTER, unknown_actor_type) {
  RouterFixture f;
  auto response =
      f.router.handle("PUT", "/actors/Missing/1/method/get", Bytes());
  ASSERT_EQ(response.status, CallbackRouter::STATUS_NOT_FOUND);
  ASSERT_EQ(f.decode(response).get_str_attr("errorCode"),
            "ERR_ACTOR_TYPE_NOT_FOUND");
  ASSERT_EQ(f.router.handle("POST", "/actors/Missing/1", Bytes()).status,
            CallbackRouter::STATUS_NOT_FOUND);
}

TEST(CALLBACKROUTER, malformed_requests) {
  RouterFixture f;
  ASSERT_EQ(f.router.handle("GET", "/unknown", Bytes()).status,
            CallbackRouter::STATUS_NOT_FOUND);
  ASSERT_EQ(f.router.handle("GET", "/actors/Counter/c1", Bytes()).status,
            CallbackRouter::STATUS_METHOD_NOT_ALLOWED);
  ASSERT_EQ(f.router.handle("POST", "/actors/Counter/c1/method/get", Bytes())
                .status,
            CallbackRouter::STATUS_METHOD_NOT_ALLOWED);
  ASSERT_EQ(f.router.handle("PUT", "/actors/Counter/c1/other/get", Bytes())
                .status,
            CallbackRouter::STATUS_NOT_FOUND);

  auto empty_timer =
      f.router.handle("PUT", "/actors/Counter/c1/method/timer/", Bytes());
  ASSERT_EQ(empty_timer.status, CallbackRouter::STATUS_BAD_REQUEST);
  ASSERT_EQ(f.decode(empty_timer).get_str_attr("errorCode"),
            "ERR_MALFORMED_REQUEST");
  ASSERT_EQ(f.router.handle("POST", "/actors//c1", Bytes()).status,
            CallbackRouter::STATUS_BAD_REQUEST);
  // The malformed timer path must not have reached the actor.
  auto value = f.router.handle("PUT", "/actors/Counter/c1/method/get", Bytes());
  ASSERT_EQ(f.decode(value).get_int_attr("value"), 0);

  auto bad_body = f.router.handle("PUT", "/actors/Counter/c1/method/get",
                                  bytes_of("garbage"));
  ASSERT_EQ(bad_body.status, CallbackRouter::STATUS_INTERNAL_ERROR);

  auto unknown_method =
      f.router.handle("PUT", "/actors/Counter/c1/method/missing", Bytes());
  ASSERT_EQ(unknown_method.status, CallbackRouter::STATUS_INTERNAL_ERROR);
}

TEST(CALLBACKROUTER, handler_failure) {
  Runtime::ActorRuntime runtime(
      std::make_shared<Runtime::ActorRuntimeConfig>(),
      []() { return std::make_shared<Client::LocalSidecarClient>(); },
      [](std::shared_ptr<Runtime::ActorRuntimeContext> /*context*/) {
        return std::make_shared<FailingHandler>();
      });
  runtime.register_actor<Actors::EchoActor>();
  CallbackRouter router(&runtime);

  auto response = router.handle("PUT", "/actors/Echo/1/method/echo", Bytes());
  ASSERT_EQ(response.status, CallbackRouter::STATUS_INTERNAL_ERROR);
  auto decoded = MsgPackSerializer::shared_instance()->deserialize(response.body);
  ASSERT_TRUE(decoded);
  ASSERT_EQ(decoded->get_str_attr("errorCode"), "ERR_ACTOR_INVOKE_METHOD");
  ASSERT_EQ(decoded->get_str_attr("message"), "dispatch failed");
}

TEST(CALLBACKROUTER, requires_runtime) {
  ASSERT_THROW(CallbackRouter(nullptr), std::invalid_argument);
}

}  // namespace ActorHost::Test
