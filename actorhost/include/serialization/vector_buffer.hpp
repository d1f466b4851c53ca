#pragma once

#include <cstddef>
#include <utility>

#include "serialization/payload.hpp"

namespace ActorHost::Serialization {

// Output sink for msgpack::packer.
class VectorBuffer {
 public:
  void write(const char* buf, size_t len) {
    buffer.insert(buffer.end(), buf, buf + len);
  }

  Bytes fetch_buffer() { return std::move(buffer); }

 private:
  Bytes buffer;
};
}  // namespace ActorHost::Serialization
