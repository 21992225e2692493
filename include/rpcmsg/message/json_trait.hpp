#pragma once

#include <concepts>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace rpcmsg::message {

// What the structural checks below need from a JSON value type. Building
// typed messages and logging still go through `Json`.
template <typename T>
concept JsonDocument = requires(const T& j, const std::string& key) {
  { j.is_object() } -> std::convertible_to<bool>;
  { j.is_array() } -> std::convertible_to<bool>;
  { j.is_string() } -> std::convertible_to<bool>;
  { j.is_null() } -> std::convertible_to<bool>;
  { j.is_number_integer() } -> std::convertible_to<bool>;
  { j.is_number_unsigned() } -> std::convertible_to<bool>;
  { j.contains(key) } -> std::convertible_to<bool>;
  { j.at(key) } -> std::convertible_to<const T&>;
  { j.template get<uint64_t>() } -> std::same_as<uint64_t>;
  { j.template get<std::string>() } -> std::same_as<std::string>;
};

using Json = nlohmann::json;

// Output type of the Dump() functions. Members keep insertion order.
using OrderedJson = nlohmann::ordered_json;

static_assert(JsonDocument<Json>);
static_assert(JsonDocument<OrderedJson>);

// True for integers representable as int64_t. Large unsigned values
// are reported as integers by the parser but would wrap on get<int64_t>().
template <JsonDocument T>
auto IsInt64(const T& value) -> bool {
  if (!value.is_number_integer()) {
    return false;
  }
  if (value.is_number_unsigned()) {
    return value.template get<uint64_t>() <=
           static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
  }
  return true;
}

template <JsonDocument T>
auto HasVersion(const T& object, std::string_view version) -> bool {
  if (!object.contains("jsonrpc")) {
    return false;
  }
  const auto& member = object.at("jsonrpc");
  return member.is_string() && member.template get<std::string>() == version;
}

// Strings, int64 integers and null. Whether null is allowed depends on
// the message shape and is checked later.
template <JsonDocument T>
auto IsIdShape(const T& id) -> bool {
  return id.is_string() || id.is_null() || IsInt64(id);
}

template <JsonDocument T>
auto IsParamsShape(const T& params) -> bool {
  return params.is_array() || params.is_object();
}

// An object with an int64 `code` and a string `message`.
template <JsonDocument T>
auto IsErrorObjectShape(const T& error) -> bool {
  return error.is_object() && error.contains("code") &&
         error.contains("message") && IsInt64(error.at("code")) &&
         error.at("message").is_string();
}

// Copies `object` with the `leading` members first, in that order, and
// the remaining members after them.
inline auto OrderedCopy(
    const Json& object, std::initializer_list<std::string_view> leading)
    -> OrderedJson {
  OrderedJson ordered = OrderedJson::object();
  for (auto key : leading) {
    auto it = object.find(std::string(key));
    if (it != object.end()) {
      ordered[std::string(key)] = OrderedJson(*it);
    }
  }
  for (const auto& [key, value] : object.items()) {
    if (!ordered.contains(key)) {
      ordered[key] = OrderedJson(value);
    }
  }
  return ordered;
}

}  // namespace rpcmsg::message
