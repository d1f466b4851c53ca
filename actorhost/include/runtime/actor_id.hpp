#ifndef ACTORHOST_INCLUDE_RUNTIME_ACTOR_ID_HPP_
#define ACTORHOST_INCLUDE_RUNTIME_ACTOR_ID_HPP_

#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace ActorHost::Runtime {

class ActorId {
 public:
  explicit ActorId(std::string id) : _id(std::move(id)) {
    if (_id.empty()) {
      throw std::invalid_argument("actor id must not be empty");
    }
  }

  bool operator==(const ActorId& other) const { return _id == other._id; }
  bool operator!=(const ActorId& other) const { return _id != other._id; }
  bool operator<(const ActorId& other) const { return _id < other._id; }

  [[nodiscard]] const std::string& id() const { return _id; }

  [[nodiscard]] std::string to_string() const { return _id; }

 private:
  std::string _id;
};

struct ActorIdHasher {
  size_t operator()(const ActorId& actor_id) const {
    return std::hash<std::string>{}(actor_id.id());
  }
};

}  // namespace ActorHost::Runtime

#endif  // ACTORHOST_INCLUDE_RUNTIME_ACTOR_ID_HPP_
