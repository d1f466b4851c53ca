#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "serialization/payload.hpp"

namespace ActorHost::Runtime {

class Actor;

// Maps method names of one actor type to invokers on the concrete class.
class ActorMethodTable {
 public:
  using Invoker = std::function<Serialization::Payload(
      Actor* actor, const Serialization::Payload& arguments)>;

  template <typename T>
  void add(std::string name, Serialization::Payload (T::*method)(
                                 const Serialization::Payload&)) {
    methods.insert_or_assign(
        std::move(name),
        [method](Actor* actor, const Serialization::Payload& arguments) {
          return (static_cast<T*>(actor)->*method)(arguments);
        });
  }

  [[nodiscard]] const Invoker* find(std::string_view name) const {
    auto it = methods.find(name);
    if (it == methods.end()) {
      return nullptr;
    }
    return &it->second;
  }

  [[nodiscard]] std::vector<std::string> method_names() const {
    std::vector<std::string> names;
    names.reserve(methods.size());
    for (const auto& [name, _] : methods) {
      names.push_back(name);
    }
    return names;
  }

 private:
  std::map<std::string, Invoker, std::less<>> methods;
};

}  // namespace ActorHost::Runtime
