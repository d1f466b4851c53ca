#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace ActorHost::Serialization {

using Bytes = std::vector<char>;

// Structured message or state value handed to a Serializer.
class Payload {
 public:
  using BinType = std::vector<char>;
  using StringList = std::vector<std::string>;
  using VariantType = std::variant<std::string, bool, int32_t, float, BinType,
                                   StringList, std::shared_ptr<Payload>>;
  using DataType = std::map<std::string, VariantType, std::less<>>;

  using const_iterator = DataType::const_iterator;

  [[nodiscard]] const_iterator begin() const { return data.begin(); }

  [[nodiscard]] const_iterator end() const { return data.end(); }

  Payload() = default;

  Payload(const Payload& old);
  Payload& operator=(const Payload& old);

  Payload(Payload&& old) = default;
  Payload& operator=(Payload&& old) = default;

  bool operator==(const Payload& other) const;
  bool operator!=(const Payload& other) const { return !(*this == other); }

  [[nodiscard]] bool has_attr(std::string_view name) const {
    return data.find(name) != data.end();
  }

  [[nodiscard]] std::optional<std::string_view> get_str_attr(
      std::string_view name) const;
  [[nodiscard]] std::optional<bool> get_bool_attr(std::string_view name) const;
  [[nodiscard]] std::optional<int32_t> get_int_attr(
      std::string_view name) const;
  [[nodiscard]] std::optional<float> get_float_attr(
      std::string_view name) const;
  [[nodiscard]] std::optional<BinType> get_bin_attr(
      std::string_view name) const;
  [[nodiscard]] std::optional<StringList> get_string_list_attr(
      std::string_view name) const;
  [[nodiscard]] std::optional<std::shared_ptr<Payload>> get_nested_component(
      std::string_view name) const;

  void set_attr(std::string_view name, std::string_view value);
  // Keeps string literals from binding to the bool overload.
  void set_attr(std::string_view name, const char* value);
  void set_attr(std::string_view name, bool value);
  void set_attr(std::string_view name, int32_t value);
  void set_attr(std::string_view name, float value);
  void set_attr(std::string_view name, BinType value);
  void set_attr(std::string_view name, StringList value);
  void set_attr(std::string_view name, std::shared_ptr<Payload> value);

  void erase_attr(std::string_view name);

  [[nodiscard]] std::string to_string() const;

  [[nodiscard]] size_t size() const { return data.size(); }

  [[nodiscard]] bool empty() const { return data.empty(); }

 private:
  DataType data{};

  template <typename T>
  std::optional<T> get_typed(std::string_view name) const {
    auto result = data.find(name);
    if (result != data.end() && std::holds_alternative<T>(result->second)) {
      return std::get<T>(result->second);
    }
    return std::nullopt;
  }
};

}  // namespace ActorHost::Serialization
