#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string_view>
#include <unordered_map>

#include "runtime/actor.hpp"
#include "runtime/actor_id.hpp"
#include "runtime/actor_runtime_context.hpp"
#include "runtime/actor_type_handler.hpp"

namespace ActorHost::Runtime {

/*
 * Default handler for one actor type. Keeps the active instances of the
 * type, activates them on first use and runs one turn at a time per
 * instance. Method arguments and results travel through the type's message
 * serializer.
 */
class ActorManager : public ActorTypeHandler {
 public:
  explicit ActorManager(std::shared_ptr<ActorRuntimeContext> runtime_context);

  void activate_actor(const ActorId& actor_id) override;
  void deactivate_actor(const ActorId& actor_id) override;
  Serialization::Bytes dispatch(
      const ActorId& actor_id, std::string_view method_name,
      const Serialization::Bytes& request_body) override;
  void fire_reminder(const ActorId& actor_id, std::string_view name,
                     const Serialization::Bytes& request_body) override;
  void fire_timer(const ActorId& actor_id, std::string_view name) override;

  [[nodiscard]] bool is_active(const ActorId& actor_id) const;
  [[nodiscard]] size_t active_actor_count() const;

  [[nodiscard]] const ActorRuntimeContext& runtime_context() const {
    return *_runtime_context;
  }

 private:
  std::shared_ptr<Actor> create_activated_actor(const ActorId& actor_id);
  std::shared_ptr<Actor> activated_actor(const ActorId& actor_id);
  Serialization::Payload decode_body(const Serialization::Bytes& body,
                                     std::string_view purpose) const;

  std::shared_ptr<ActorRuntimeContext> _runtime_context;
  std::unordered_map<ActorId, std::shared_ptr<Actor>, ActorIdHasher>
      active_actors;
  mutable std::mutex active_actors_mtx;
};

}  // namespace ActorHost::Runtime
