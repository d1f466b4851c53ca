#pragma once

#include <memory>
#include <optional>
#include <string_view>

#include "serialization/serializer.hpp"

namespace ActorHost::Serialization {

/*
 * Encodes a Payload as a msgpack map. Nested payloads become nested maps,
 * string lists become arrays of str and binary values use the bin family.
 * The serializer holds no state, so one instance may be shared freely.
 */
class MsgPackSerializer : public Serializer {
 public:
  Bytes serialize(const Payload& payload) const override;
  std::optional<Payload> deserialize(const char* data,
                                     size_t size) const override;
  std::string_view content_type() const override {
    return "application/msgpack";
  }

  using Serializer::deserialize;

  static std::shared_ptr<const MsgPackSerializer> shared_instance();
};

}  // namespace ActorHost::Serialization
