#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "rpcmsg/message/json_trait.hpp"

namespace rpcmsg::message {

constexpr std::string_view kJsonRpcVersion = "2.0";

// Raw values quoted in log lines are cut to this many characters.
constexpr size_t kMaxLoggedValueLength = 70;

// An id that is known to be present. Requests and success responses
// always carry one.
using RequestId = std::variant<int64_t, std::string>;

// An id that may be absent. Only error responses may carry an absent id,
// written as `"id": null` on the wire.
class Id {
 public:
  Id() = default;

  template <std::signed_integral T>
  Id(T value) : value_(static_cast<int64_t>(value)) {  // NOLINT
  }

  // Unsigned values above INT64_MAX would wrap.
  template <std::unsigned_integral T>
  Id(T value) = delete;

  Id(std::string value) : value_(std::move(value)) {  // NOLINT
  }

  Id(const char* value) : value_(std::string(value)) {  // NOLINT
  }

  Id(const RequestId& id);  // NOLINT

  [[nodiscard]] auto IsAbsent() const -> bool {
    return std::holds_alternative<std::monostate>(value_);
  }

  [[nodiscard]] auto AsInteger() const -> std::optional<int64_t>;

  [[nodiscard]] auto AsString() const -> std::optional<std::string>;

  [[nodiscard]] auto AsRequestId() const -> std::optional<RequestId>;

  [[nodiscard]] auto ToJson() const -> Json;

  auto operator==(const Id& other) const -> bool = default;

 private:
  std::variant<std::monostate, int64_t, std::string> value_;
};

auto RequestIdToJson(const RequestId& id) -> Json;

// Positional or named parameters, or none at all.
class Params {
 public:
  Params() = default;

  Params(Json::array_t values) : value_(std::move(values)) {  // NOLINT
  }

  Params(Json::object_t values) : value_(std::move(values)) {  // NOLINT
  }

  /// Accepts a JSON array or object. Any other value is not a valid
  /// params payload and yields std::nullopt.
  static auto FromJson(const Json& json) -> std::optional<Params>;

  [[nodiscard]] auto IsAbsent() const -> bool {
    return std::holds_alternative<std::monostate>(value_);
  }

  [[nodiscard]] auto GetArray() const -> const Json::array_t* {
    return std::get_if<Json::array_t>(&value_);
  }

  [[nodiscard]] auto GetObject() const -> const Json::object_t* {
    return std::get_if<Json::object_t>(&value_);
  }

  /// Absent params serialize as null; callers omit the member instead.
  [[nodiscard]] auto ToJson() const -> Json;

  auto operator==(const Params& other) const -> bool = default;

 private:
  std::variant<std::monostate, Json::array_t, Json::object_t> value_;
};

}  // namespace rpcmsg::message
