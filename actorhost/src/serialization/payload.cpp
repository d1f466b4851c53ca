#include "serialization/payload.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace ActorHost::Serialization {

Payload::Payload(const Payload& old) {
  for (const auto& [key, value] : old.data) {
    if (std::holds_alternative<std::shared_ptr<Payload>>(value)) {
      const auto& nested = std::get<std::shared_ptr<Payload>>(value);
      data[key] = nested ? std::make_shared<Payload>(*nested) : nullptr;
    } else {
      data[key] = value;
    }
  }
}

Payload& Payload::operator=(const Payload& old) {
  if (this == &old) {
    return *this;
  }
  Payload copy(old);
  data = std::move(copy.data);
  return *this;
}

bool Payload::operator==(const Payload& other) const {
  if (other.data.size() != data.size()) {
    return false;
  }
  for (const auto& [key, value] : data) {
    auto other_it = other.data.find(key);
    if (other_it == other.data.end() ||
        other_it->second.index() != value.index()) {
      return false;
    }
    if (std::holds_alternative<std::shared_ptr<Payload>>(value)) {
      const auto& mine = std::get<std::shared_ptr<Payload>>(value);
      const auto& theirs = std::get<std::shared_ptr<Payload>>(other_it->second);
      if (!mine || !theirs) {
        if (mine != theirs) {
          return false;
        }
      } else if (!(*mine == *theirs)) {
        return false;
      }
    } else if (!(value == other_it->second)) {
      return false;
    }
  }
  return true;
}

std::optional<std::string_view> Payload::get_str_attr(
    std::string_view name) const {
  auto result = data.find(name);
  if (result != data.end()) {
    if (std::holds_alternative<std::string>(result->second)) {
      return std::string_view(std::get<std::string>(result->second));
    }
  }
  return std::nullopt;
}

std::optional<bool> Payload::get_bool_attr(std::string_view name) const {
  return get_typed<bool>(name);
}

std::optional<int32_t> Payload::get_int_attr(std::string_view name) const {
  return get_typed<int32_t>(name);
}

std::optional<float> Payload::get_float_attr(std::string_view name) const {
  return get_typed<float>(name);
}

std::optional<Payload::BinType> Payload::get_bin_attr(
    std::string_view name) const {
  return get_typed<BinType>(name);
}

std::optional<Payload::StringList> Payload::get_string_list_attr(
    std::string_view name) const {
  return get_typed<StringList>(name);
}

std::optional<std::shared_ptr<Payload>> Payload::get_nested_component(
    std::string_view name) const {
  return get_typed<std::shared_ptr<Payload>>(name);
}

void Payload::set_attr(std::string_view name, std::string_view value) {
  data.insert_or_assign(std::string(name), std::string(value));
}

void Payload::set_attr(std::string_view name, const char* value) {
  set_attr(name, std::string_view(value));
}

void Payload::set_attr(std::string_view name, bool value) {
  data.insert_or_assign(std::string(name), value);
}

void Payload::set_attr(std::string_view name, int32_t value) {
  data.insert_or_assign(std::string(name), value);
}

void Payload::set_attr(std::string_view name, float value) {
  data.insert_or_assign(std::string(name), value);
}

void Payload::set_attr(std::string_view name, BinType value) {
  data.insert_or_assign(std::string(name), std::move(value));
}

void Payload::set_attr(std::string_view name, StringList value) {
  data.insert_or_assign(std::string(name), std::move(value));
}

void Payload::set_attr(std::string_view name, std::shared_ptr<Payload> value) {
  data.insert_or_assign(std::string(name), std::move(value));
}

void Payload::erase_attr(std::string_view name) {
  auto it = data.find(name);
  if (it != data.end()) {
    data.erase(it);
  }
}

std::string Payload::to_string() const {
  std::string buffer = "{";
  for (const auto& [key, value] : data) {
    buffer += " " + key + "=";
    if (std::holds_alternative<std::string>(value)) {
      buffer += std::get<std::string>(value);
    } else if (std::holds_alternative<bool>(value)) {
      buffer += std::get<bool>(value) ? "true" : "false";
    } else if (std::holds_alternative<int32_t>(value)) {
      buffer += std::to_string(std::get<int32_t>(value));
    } else if (std::holds_alternative<float>(value)) {
      buffer += fmt::format("{}", std::get<float>(value));
    } else if (std::holds_alternative<BinType>(value)) {
      buffer += fmt::format("<{} bytes>", std::get<BinType>(value).size());
    } else if (std::holds_alternative<StringList>(value)) {
      buffer += fmt::format("[{}]", fmt::join(std::get<StringList>(value), ","));
    } else if (std::holds_alternative<std::shared_ptr<Payload>>(value)) {
      const auto& nested = std::get<std::shared_ptr<Payload>>(value);
      buffer += nested ? nested->to_string() : "null";
    }
  }
  return buffer + " }";
}

}  // namespace ActorHost::Serialization
