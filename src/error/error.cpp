#include "rpcmsg/error/error.hpp"

#include "rpcmsg/message/json_trait.hpp"

namespace rpcmsg::error {

RpcError::RpcError(
    int64_t code, std::string message, std::optional<nlohmann::json> data)
    : code_(code), message_(std::move(message)), data_(std::move(data)) {
}

RpcError::RpcError(
    RpcErrorCode code, std::string message,
    std::optional<nlohmann::json> data)
    : RpcError(ToInteger(code), std::move(message), std::move(data)) {
}

auto RpcError::FromCode(
    RpcErrorCode code, std::optional<nlohmann::json> data) -> RpcError {
  return {code, std::string(DefaultMessageFor(code)), std::move(data)};
}

auto RpcError::UnexpectedFromCode(RpcErrorCode code, std::string message)
    -> std::unexpected<RpcError> {
  if (message.empty()) {
    message = std::string(DefaultMessageFor(code));
  }
  return std::unexpected(RpcError(code, std::move(message)));
}

auto RpcError::ParseError() -> RpcError {
  return FromCode(RpcErrorCode::kParseError);
}

auto RpcError::InvalidRequest() -> RpcError {
  return FromCode(RpcErrorCode::kInvalidRequest);
}

auto RpcError::MethodNotFound() -> RpcError {
  return FromCode(RpcErrorCode::kMethodNotFound);
}

auto RpcError::InvalidParams() -> RpcError {
  return FromCode(RpcErrorCode::kInvalidParams);
}

auto RpcError::InternalError() -> RpcError {
  return FromCode(RpcErrorCode::kInternalError);
}

auto RpcError::ServerError(int64_t code) -> RpcError {
  return {code, std::string(kServerErrorMessage)};
}

auto RpcError::FromJson(const nlohmann::json& json)
    -> std::optional<RpcError> {
  if (!message::IsErrorObjectShape(json)) {
    return std::nullopt;
  }

  std::optional<nlohmann::json> data;
  if (auto data_it = json.find("data"); data_it != json.end()) {
    data = *data_it;
  }

  return RpcError(
      json.at("code").get<int64_t>(), json.at("message").get<std::string>(),
      std::move(data));
}

auto RpcError::WithData(nlohmann::json data) const -> RpcError {
  return {code_, message_, std::move(data)};
}

auto RpcError::ToJson() const -> nlohmann::json {
  nlohmann::json json;
  json["code"] = code_;
  json["message"] = message_;
  if (data_.has_value()) {
    json["data"] = data_.value();
  }
  return json;
}

auto RpcError::Dump() const -> std::string {
  return message::OrderedCopy(ToJson(), {"code", "message", "data"}).dump();
}

}  // namespace rpcmsg::error
