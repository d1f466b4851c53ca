#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>

#include "serialization/payload.hpp"

namespace ActorHost::Serialization {

struct Serializer {
  virtual Bytes serialize(const Payload& payload) const = 0;
  virtual std::optional<Payload> deserialize(const char* data,
                                             size_t size) const = 0;
  virtual std::string_view content_type() const = 0;

  std::optional<Payload> deserialize(const Bytes& data) const {
    return deserialize(data.data(), data.size());
  }

  virtual ~Serializer() = default;
};

// Serializers threaded through one actor type registration.
struct SerializerConfiguration {
  std::shared_ptr<const Serializer> message;
  std::shared_ptr<const Serializer> state;

  // msgpack for both messages and state.
  static SerializerConfiguration defaults();
};

}  // namespace ActorHost::Serialization
