#include "serialization/msgpack_serializer.hpp"

#include <msgpack.hpp>
#include <string>
#include <utility>

#include "serialization/vector_buffer.hpp"
#include "support/logger.hpp"

namespace ActorHost::Serialization {

namespace {

void pack_payload(msgpack::packer<VectorBuffer>* packer,
                  const Payload& payload) {
  packer->pack_map(static_cast<uint32_t>(payload.size()));
  for (const auto& [key, value] : payload) {
    packer->pack(key);
    if (std::holds_alternative<std::string>(value)) {
      packer->pack(std::get<std::string>(value));
    } else if (std::holds_alternative<bool>(value)) {
      packer->pack(std::get<bool>(value));
    } else if (std::holds_alternative<int32_t>(value)) {
      packer->pack(std::get<int32_t>(value));
    } else if (std::holds_alternative<float>(value)) {
      packer->pack(std::get<float>(value));
    } else if (std::holds_alternative<Payload::BinType>(value)) {
      const auto& bin = std::get<Payload::BinType>(value);
      packer->pack_bin(static_cast<uint32_t>(bin.size()));
      packer->pack_bin_body(bin.data(), static_cast<uint32_t>(bin.size()));
    } else if (std::holds_alternative<Payload::StringList>(value)) {
      const auto& list = std::get<Payload::StringList>(value);
      packer->pack_array(static_cast<uint32_t>(list.size()));
      for (const auto& item : list) {
        packer->pack(item);
      }
    } else if (std::holds_alternative<std::shared_ptr<Payload>>(value)) {
      const auto& nested = std::get<std::shared_ptr<Payload>>(value);
      if (nested) {
        pack_payload(packer, *nested);
      } else {
        packer->pack_nil();
      }
    }
  }
}

bool msgpack_to_payload(Payload* handle, const msgpack::object_map& map) {
  for (uint32_t i = 0; i < map.size; i++) {
    // NOLINTNEXTLINE (cppcoreguidelines-pro-bounds-pointer-arithmetic)
    const msgpack::object_kv& value_pair = map.ptr[i];
    auto key = value_pair.key.as<std::string>();
    switch (value_pair.val.type) {
      case msgpack::type::object_type::STR: {
        handle->set_attr(key, value_pair.val.as<std::string>());
        break;
      }
      case msgpack::type::object_type::BOOLEAN: {
        handle->set_attr(key, value_pair.val.as<bool>());
        break;
      }
      case msgpack::type::object_type::FLOAT32:
      case msgpack::type::object_type::FLOAT64: {
        handle->set_attr(key, value_pair.val.as<float>());
        break;
      }
      case msgpack::type::object_type::POSITIVE_INTEGER:
      case msgpack::type::object_type::NEGATIVE_INTEGER: {
        handle->set_attr(key, value_pair.val.as<int32_t>());
        break;
      }
      case msgpack::type::object_type::BIN: {
        // NOLINTNEXTLINE (cppcoreguidelines-pro-type-union-access)
        const auto& bin = value_pair.val.via.bin;
        handle->set_attr(key, Payload::BinType(bin.ptr, bin.ptr + bin.size));
        break;
      }
      case msgpack::type::object_type::ARRAY: {
        handle->set_attr(key,
                         value_pair.val.as<std::vector<std::string>>());
        break;
      }
      case msgpack::type::object_type::MAP: {
        auto element_handle = std::make_shared<Payload>();
        // NOLINTNEXTLINE (cppcoreguidelines-pro-type-union-access)
        if (!msgpack_to_payload(element_handle.get(), value_pair.val.via.map)) {
          return false;
        }
        handle->set_attr(key, std::move(element_handle));
        break;
      }
      case msgpack::type::object_type::NIL: {
        handle->set_attr(key, std::shared_ptr<Payload>());
        break;
      }
      default: {
        Support::Logger::error("MSGPACK-SERIALIZER",
                               "Unsupported value type for \"%s\", %u",
                               key.c_str(),
                               static_cast<unsigned>(value_pair.val.type));
        return false;
      }
    }
  }
  return true;
}

}  // namespace

Bytes MsgPackSerializer::serialize(const Payload& payload) const {
  VectorBuffer buffer;
  msgpack::packer<VectorBuffer> packer(buffer);
  pack_payload(&packer, payload);
  return buffer.fetch_buffer();
}

std::optional<Payload> MsgPackSerializer::deserialize(const char* data,
                                                      size_t size) const {
  if (size == 0) {
    Support::Logger::warning("MSGPACK-SERIALIZER", "Empty msgpack data");
    return std::nullopt;
  }
  try {
    msgpack::object_handle oh = msgpack::unpack(data, size);
    const msgpack::object& root = oh.get();
    if (root.type != msgpack::type::object_type::MAP) {
      Support::Logger::warning("MSGPACK-SERIALIZER", "Root type is not a map");
      return std::nullopt;
    }
    Payload payload;
    // NOLINTNEXTLINE (cppcoreguidelines-pro-type-union-access)
    if (!msgpack_to_payload(&payload, root.via.map)) {
      return std::nullopt;
    }
    return payload;
  } catch (const msgpack::unpack_error& e) {
    Support::Logger::warning("MSGPACK-SERIALIZER", "Malformed data: %s",
                             e.what());
  } catch (const msgpack::type_error& e) {
    Support::Logger::warning("MSGPACK-SERIALIZER", "Type mismatch: %s",
                             e.what());
  }
  return std::nullopt;
}

std::shared_ptr<const MsgPackSerializer> MsgPackSerializer::shared_instance() {
  static auto instance = std::make_shared<const MsgPackSerializer>();
  return instance;
}

SerializerConfiguration SerializerConfiguration::defaults() {
  return SerializerConfiguration{MsgPackSerializer::shared_instance(),
                                 MsgPackSerializer::shared_instance()};
}

}  // namespace ActorHost::Serialization
