#include "rpcmsg/message/types.hpp"

namespace rpcmsg::message {

Id::Id(const RequestId& id) {
  std::visit([this](const auto& v) { value_ = v; }, id);
}

auto Id::AsInteger() const -> std::optional<int64_t> {
  if (const auto* v = std::get_if<int64_t>(&value_)) {
    return *v;
  }
  return std::nullopt;
}

auto Id::AsString() const -> std::optional<std::string> {
  if (const auto* v = std::get_if<std::string>(&value_)) {
    return *v;
  }
  return std::nullopt;
}

auto Id::AsRequestId() const -> std::optional<RequestId> {
  if (const auto* v = std::get_if<int64_t>(&value_)) {
    return RequestId{*v};
  }
  if (const auto* v = std::get_if<std::string>(&value_)) {
    return RequestId{*v};
  }
  return std::nullopt;
}

auto Id::ToJson() const -> Json {
  if (const auto* v = std::get_if<int64_t>(&value_)) {
    return *v;
  }
  if (const auto* v = std::get_if<std::string>(&value_)) {
    return *v;
  }
  return nullptr;
}

auto RequestIdToJson(const RequestId& id) -> Json {
  Json json;
  std::visit([&json](const auto& v) { json = v; }, id);
  return json;
}

auto Params::FromJson(const Json& json) -> std::optional<Params> {
  if (json.is_array()) {
    return Params(json.get<Json::array_t>());
  }
  if (json.is_object()) {
    return Params(json.get<Json::object_t>());
  }
  return std::nullopt;
}

auto Params::ToJson() const -> Json {
  if (const auto* v = GetArray()) {
    return *v;
  }
  if (const auto* v = GetObject()) {
    return *v;
  }
  return nullptr;
}

}  // namespace rpcmsg::message
