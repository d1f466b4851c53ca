#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include "runtime/actor_id.hpp"
#include "serialization/payload.hpp"

namespace ActorHost::Runtime {

class ActorRuntimeContext;
class ActorManager;

class Actor {
 public:
  using TimerCallback =
      std::function<void(Actor* actor, const Serialization::Payload& state)>;

  Actor(ActorRuntimeContext* runtime_context, ActorId actor_id);
  virtual ~Actor() = default;

  Actor(const Actor&) = delete;
  Actor& operator=(const Actor&) = delete;

  virtual void on_activate() {}
  virtual void on_deactivate() {}
  virtual void on_pre_actor_method(std::string_view /*method_name*/) {}
  virtual void on_post_actor_method(std::string_view /*method_name*/) {}

  template <typename T>
  static std::unique_ptr<Actor> create_instance(
      ActorRuntimeContext* runtime_context, ActorId actor_id) {
    return std::make_unique<T>(runtime_context, std::move(actor_id));
  }

  [[nodiscard]] const ActorId& id() const { return _id; }

  [[nodiscard]] ActorRuntimeContext* runtime_context() const {
    return _runtime_context;
  }

 protected:
  void register_timer(std::string name, TimerCallback callback,
                      Serialization::Payload state,
                      std::chrono::milliseconds due_time,
                      std::chrono::milliseconds period);
  void unregister_timer(std::string_view name);

  void register_reminder(std::string_view name,
                         const Serialization::Payload& state,
                         std::chrono::milliseconds due_time,
                         std::chrono::milliseconds period);
  void unregister_reminder(std::string_view name);

  void save_state(std::string_view key, const Serialization::Payload& value);
  std::optional<Serialization::Payload> load_state(std::string_view key);
  void remove_state(std::string_view key);

 private:
  struct Timer {
    TimerCallback callback;
    Serialization::Payload state;
  };

  // Runs the named timer callback; false if no such timer is registered.
  bool fire_timer(std::string_view name);

  ActorRuntimeContext* _runtime_context;
  ActorId _id;
  std::unordered_map<std::string, Timer> timers;
  std::mutex turn_mtx;

  friend ActorManager;
};

class Remindable {
 public:
  virtual void receive_reminder(std::string_view name,
                                const Serialization::Payload& state,
                                std::chrono::milliseconds due_time,
                                std::chrono::milliseconds period) = 0;
  virtual ~Remindable() = default;
};

}  // namespace ActorHost::Runtime
