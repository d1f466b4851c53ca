#pragma once

#include <memory>
#include <utility>

#include "client/sidecar_client.hpp"
#include "runtime/actor.hpp"
#include "runtime/actor_type_information.hpp"
#include "serialization/serializer.hpp"

namespace ActorHost::Runtime {

// Everything one actor type handler needs: type information, the message
// and state serializers and the sidecar client.
class ActorRuntimeContext {
 public:
  // Throws std::invalid_argument when a serializer or the client is null.
  ActorRuntimeContext(ActorTypeInformation type_info,
                      Serialization::SerializerConfiguration serializers,
                      std::shared_ptr<Client::SidecarClient> sidecar_client);

  [[nodiscard]] const ActorTypeInformation& type_info() const {
    return _type_info;
  }

  [[nodiscard]] const Serialization::Serializer& message_serializer() const {
    return *_serializers.message;
  }

  [[nodiscard]] const Serialization::Serializer& state_serializer() const {
    return *_serializers.state;
  }

  [[nodiscard]] Client::SidecarClient& sidecar_client() const {
    return *_sidecar_client;
  }

  std::unique_ptr<Actor> create_actor(ActorId actor_id) {
    return _type_info.create_actor(this, std::move(actor_id));
  }

 private:
  ActorTypeInformation _type_info;
  Serialization::SerializerConfiguration _serializers;
  std::shared_ptr<Client::SidecarClient> _sidecar_client;
};

}  // namespace ActorHost::Runtime
