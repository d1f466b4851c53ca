#pragma once

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "client/local_sidecar_client.hpp"
#include "runtime/actor_runtime.hpp"
#include "runtime/actor_type_handler.hpp"

namespace ActorHost::Test {

using Runtime::ActorId;
using Serialization::Bytes;

struct RecordedCall {
  std::string operation;
  std::string actor_id;
  std::string name;
  Bytes body;
};

// Remembers every call it receives and answers dispatch with the request
// body.
class RecordingHandler : public Runtime::ActorTypeHandler {
 public:
  explicit RecordingHandler(
      std::shared_ptr<Runtime::ActorRuntimeContext> runtime_context)
      : runtime_context(std::move(runtime_context)) {}

  void activate_actor(const ActorId& actor_id) override {
    record("activate", actor_id, "", Bytes());
  }

  void deactivate_actor(const ActorId& actor_id) override {
    record("deactivate", actor_id, "", Bytes());
  }

  Bytes dispatch(const ActorId& actor_id, std::string_view method_name,
                 const Bytes& request_body) override {
    record("dispatch", actor_id, method_name, request_body);
    return request_body;
  }

  void fire_reminder(const ActorId& actor_id, std::string_view name,
                     const Bytes& request_body) override {
    record("reminder", actor_id, name, request_body);
  }

  void fire_timer(const ActorId& actor_id, std::string_view name) override {
    record("timer", actor_id, name, Bytes());
  }

  std::vector<RecordedCall> recorded_calls() const {
    std::unique_lock lck(mtx);
    return calls;
  }

  std::shared_ptr<Runtime::ActorRuntimeContext> runtime_context;

 private:
  void record(std::string_view operation, const ActorId& actor_id,
              std::string_view name, const Bytes& body) {
    std::unique_lock lck(mtx);
    calls.push_back(RecordedCall{std::string(operation), actor_id.id(),
                                 std::string(name), body});
  }

  std::vector<RecordedCall> calls;
  mutable std::mutex mtx;
};

// Fails every call.
class FailingHandler : public Runtime::ActorTypeHandler {
 public:
  void activate_actor(const ActorId& /*actor_id*/) override {
    throw std::runtime_error("activation failed");
  }
  void deactivate_actor(const ActorId& /*actor_id*/) override {
    throw std::runtime_error("deactivation failed");
  }
  Bytes dispatch(const ActorId& /*actor_id*/, std::string_view /*method_name*/,
                 const Bytes& /*request_body*/) override {
    throw std::runtime_error("dispatch failed");
  }
  void fire_reminder(const ActorId& /*actor_id*/, std::string_view /*name*/,
                     const Bytes& /*request_body*/) override {
    throw std::runtime_error("reminder failed");
  }
  void fire_timer(const ActorId& /*actor_id*/,
                  std::string_view /*name*/) override {
    throw std::runtime_error("timer failed");
  }
};

// Runtime whose handlers are RecordingHandlers; every built handler is kept
// for inspection.
struct RecordingRuntime {
  RecordingRuntime()
      : runtime(
            std::make_shared<Runtime::ActorRuntimeConfig>(),
            []() { return std::make_shared<Client::LocalSidecarClient>(); },
            [this](std::shared_ptr<Runtime::ActorRuntimeContext> context) {
              auto handler =
                  std::make_shared<RecordingHandler>(std::move(context));
              std::unique_lock lck(mtx);
              handlers.push_back(handler);
              return handler;
            }) {}

  // The handler built by the latest registration of the type.
  std::shared_ptr<RecordingHandler> handler_for(std::string_view type_name) {
    std::unique_lock lck(mtx);
    for (auto it = handlers.rbegin(); it != handlers.rend(); ++it) {
      if ((*it)->runtime_context->type_info().type_name() == type_name) {
        return *it;
      }
    }
    return nullptr;
  }

  std::mutex mtx;
  std::vector<std::shared_ptr<RecordingHandler>> handlers;
  Runtime::ActorRuntime runtime;
};

inline Bytes bytes_of(std::string_view text) {
  return Bytes(text.begin(), text.end());
}

}  // namespace ActorHost::Test
