#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "runtime/actor.hpp"
#include "runtime/actor_id.hpp"
#include "runtime/actor_method_table.hpp"

namespace ActorHost::Runtime {

class ActorRuntimeContext;

class ActorTypeInformation {
 public:
  using ConstructionMethod = std::function<std::unique_ptr<Actor>(
      ActorRuntimeContext* runtime_context, ActorId actor_id)>;

  // Throws std::invalid_argument for an empty type name or a missing
  // construction method.
  ActorTypeInformation(std::string type_name,
                       ConstructionMethod construction_method,
                       ActorMethodTable method_table, bool remindable);

  /*
   * Derives the type information of an actor implementation. T provides
   *   constexpr static std::string_view TYPE_NAME
   *   static void define_methods(ActorMethodTable* table)
   * and is remindable when it also derives from Remindable.
   */
  template <typename T>
  static ActorTypeInformation create() {
    static_assert(std::is_base_of_v<Actor, T>,
                  "actor implementations derive from Actor");
    ActorMethodTable method_table;
    T::define_methods(&method_table);
    return ActorTypeInformation(std::string(T::TYPE_NAME),
                                &Actor::create_instance<T>,
                                std::move(method_table),
                                std::is_base_of_v<Remindable, T>);
  }

  [[nodiscard]] const std::string& type_name() const { return _type_name; }

  // Names of the methods callable through dispatch.
  [[nodiscard]] std::vector<std::string> interfaces() const {
    return _method_table.method_names();
  }

  [[nodiscard]] bool is_remindable() const { return _remindable; }

  [[nodiscard]] const ActorMethodTable& method_table() const {
    return _method_table;
  }

  std::unique_ptr<Actor> create_actor(ActorRuntimeContext* runtime_context,
                                      ActorId actor_id) const {
    return _construction_method(runtime_context, std::move(actor_id));
  }

 private:
  std::string _type_name;
  ConstructionMethod _construction_method;
  ActorMethodTable _method_table;
  bool _remindable;
};

}  // namespace ActorHost::Runtime
