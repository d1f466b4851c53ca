#include "runtime/actor_runtime_context.hpp"

#include <stdexcept>

namespace ActorHost::Runtime {

ActorRuntimeContext::ActorRuntimeContext(
    ActorTypeInformation type_info,
    Serialization::SerializerConfiguration serializers,
    std::shared_ptr<Client::SidecarClient> sidecar_client)
    : _type_info(std::move(type_info)),
      _serializers(std::move(serializers)),
      _sidecar_client(std::move(sidecar_client)) {
  if (!_serializers.message || !_serializers.state) {
    throw std::invalid_argument("actor type " + _type_info.type_name() +
                                " registered without serializers");
  }
  if (!_sidecar_client) {
    throw std::invalid_argument("actor type " + _type_info.type_name() +
                                " registered without sidecar client");
  }
}

}  // namespace ActorHost::Runtime
