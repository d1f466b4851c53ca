#include "runtime/actor_type_information.hpp"

#include <stdexcept>

namespace ActorHost::Runtime {

ActorTypeInformation::ActorTypeInformation(
    std::string type_name, ConstructionMethod construction_method,
    ActorMethodTable method_table, bool remindable)
    : _type_name(std::move(type_name)),
      _construction_method(std::move(construction_method)),
      _method_table(std::move(method_table)),
      _remindable(remindable) {
  if (_type_name.empty()) {
    throw std::invalid_argument("actor type name must not be empty");
  }
  if (!_construction_method) {
    throw std::invalid_argument("actor type " + _type_name +
                                " has no construction method");
  }
}

}  // namespace ActorHost::Runtime
