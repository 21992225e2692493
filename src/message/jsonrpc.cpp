#include "rpcmsg/message/jsonrpc.hpp"

#include <type_traits>

#include <spdlog/spdlog.h>

namespace rpcmsg::message {

namespace {

auto Reject(ValidationReason reason, std::string detail, const Json& raw)
    -> JsonRpc {
  if (spdlog::should_log(spdlog::level::debug)) {
    // Strings in a value built in code may hold invalid UTF-8.
    auto text = raw.dump(-1, ' ', false, Json::error_handler_t::replace);
    spdlog::debug(
        "Rejected JSON-RPC message ({}): {}", detail,
        text.substr(0, kMaxLoggedValueLength));
  }
  return Errors({ValidationFailure{reason, std::move(detail), raw}});
}

auto ReadId(const Json& id_json) -> Id {
  if (id_json.is_string()) {
    return id_json.get<std::string>();
  }
  if (id_json.is_null()) {
    return {};
  }
  return id_json.get<int64_t>();
}

auto ClassifyCall(const Json& raw) -> JsonRpc {
  const auto& method_json = raw.at("method");
  if (!method_json.is_string()) {
    return Reject(
        ValidationReason::kFieldTypeMismatch, "'method' must be a string",
        raw);
  }

  Params params;
  if (raw.contains("params")) {
    const auto& params_json = raw.at("params");
    if (!IsParamsShape(params_json)) {
      return Reject(
          ValidationReason::kFieldTypeMismatch,
          "'params' must be an array or an object", raw);
    }
    params = Params::FromJson(params_json).value();
  }

  auto method = method_json.get<std::string>();
  if (!raw.contains("id")) {
    return Notification(std::move(method), std::move(params));
  }

  auto id = ReadId(raw.at("id")).AsRequestId();
  if (!id.has_value()) {
    return Reject(
        ValidationReason::kIdTypeMismatch,
        "Request 'id' must not be null", raw);
  }
  return Request(std::move(id.value()), std::move(method), std::move(params));
}

auto ClassifyError(const Json& raw) -> JsonRpc {
  auto error = RpcError::FromJson(raw.at("error"));
  if (!error.has_value()) {
    return Reject(
        ValidationReason::kFieldTypeMismatch,
        "'error' must be an object with an integer 'code' and a string "
        "'message'",
        raw);
  }

  Id id;
  if (raw.contains("id")) {
    id = ReadId(raw.at("id"));
  }
  return ErrorResponse(std::move(id), std::move(error.value()));
}

// Envelope members in wire order, `jsonrpc` first.
auto OrderedMessage(const Json& message) -> OrderedJson {
  auto ordered = OrderedCopy(
      message, {"jsonrpc", "method", "params", "result", "error", "id"});
  if (auto it = message.find("error"); it != message.end() && it->is_object()) {
    ordered["error"] = OrderedCopy(*it, {"code", "message", "data"});
  }
  return ordered;
}

}  // namespace

auto ToString(MessageKind kind) -> std::string_view {
  switch (kind) {
    case MessageKind::kRequest:
      return "request";
    case MessageKind::kNotification:
      return "notification";
    case MessageKind::kSuccess:
      return "success";
    case MessageKind::kError:
      return "error";
    case MessageKind::kErrors:
      return "errors";
  }
  return "unknown";
}

JsonRpc::JsonRpc(Request request) : message_(std::move(request)) {
}

JsonRpc::JsonRpc(Notification notification)
    : message_(std::move(notification)) {
}

JsonRpc::JsonRpc(Success success) : message_(std::move(success)) {
}

JsonRpc::JsonRpc(ErrorResponse error_response)
    : message_(std::move(error_response)) {
}

JsonRpc::JsonRpc(Errors errors) : message_(std::move(errors)) {
}

auto JsonRpc::MakeRequest(RequestId id, std::string method, Params params)
    -> JsonRpc {
  return Request(std::move(id), std::move(method), std::move(params));
}

auto JsonRpc::MakeNotification(std::string method, Params params)
    -> JsonRpc {
  return Notification(std::move(method), std::move(params));
}

auto JsonRpc::MakeSuccess(RequestId id, Json result) -> JsonRpc {
  return Success(std::move(id), std::move(result));
}

auto JsonRpc::MakeError(Id id, RpcError error) -> JsonRpc {
  return ErrorResponse(std::move(id), std::move(error));
}

auto JsonRpc::FromValue(const Json& raw) -> JsonRpc {
  if (!raw.is_object()) {
    return Reject(
        ValidationReason::kNotAnObject, "Message must be a JSON object", raw);
  }

  if (!HasVersion(raw, kJsonRpcVersion)) {
    return Reject(
        ValidationReason::kInvalidVersion,
        "Missing or invalid 'jsonrpc' version", raw);
  }

  const bool has_id = raw.contains("id");
  if (has_id && !IsIdShape(raw.at("id"))) {
    return Reject(
        ValidationReason::kIdTypeMismatch,
        "'id' must be a string, an integer or null", raw);
  }

  if (raw.contains("method")) {
    return ClassifyCall(raw);
  }

  if (raw.contains("result") && has_id) {
    auto id = ReadId(raw.at("id")).AsRequestId();
    if (!id.has_value()) {
      return Reject(
          ValidationReason::kIdTypeMismatch,
          "Success response 'id' must not be null", raw);
    }
    return Success(std::move(id.value()), raw.at("result"));
  }

  if (raw.contains("error")) {
    return ClassifyError(raw);
  }

  return Reject(
      ValidationReason::kUnrecognizedShape,
      "Expected 'method', 'result' or 'error'", raw);
}

auto JsonRpc::Kind() const -> MessageKind {
  return std::visit(
      [](const auto& m) -> MessageKind {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, Request>) {
          return MessageKind::kRequest;
        } else if constexpr (std::is_same_v<T, Notification>) {
          return MessageKind::kNotification;
        } else if constexpr (std::is_same_v<T, Success>) {
          return MessageKind::kSuccess;
        } else if constexpr (std::is_same_v<T, ErrorResponse>) {
          return MessageKind::kError;
        } else {
          return MessageKind::kErrors;
        }
      },
      message_);
}

auto JsonRpc::GetVersion() const -> std::optional<std::string_view> {
  if (std::holds_alternative<Errors>(message_)) {
    return std::nullopt;
  }
  return kJsonRpcVersion;
}

auto JsonRpc::GetId() const -> std::optional<Id> {
  if (const auto* m = std::get_if<Request>(&message_)) {
    return Id(m->GetId());
  }
  if (const auto* m = std::get_if<Success>(&message_)) {
    return Id(m->GetId());
  }
  if (const auto* m = std::get_if<ErrorResponse>(&message_)) {
    return m->GetId();
  }
  return std::nullopt;
}

auto JsonRpc::GetMethod() const -> std::optional<std::string_view> {
  if (const auto* m = std::get_if<Request>(&message_)) {
    return m->GetMethod();
  }
  if (const auto* m = std::get_if<Notification>(&message_)) {
    return m->GetMethod();
  }
  return std::nullopt;
}

auto JsonRpc::GetParams() const -> const Params* {
  if (const auto* m = std::get_if<Request>(&message_)) {
    return &m->GetParams();
  }
  if (const auto* m = std::get_if<Notification>(&message_)) {
    return &m->GetParams();
  }
  return nullptr;
}

auto JsonRpc::GetResult() const -> const Json* {
  if (const auto* m = std::get_if<Success>(&message_)) {
    return &m->GetResult();
  }
  return nullptr;
}

auto JsonRpc::GetError() const -> const RpcError* {
  if (const auto* m = std::get_if<ErrorResponse>(&message_)) {
    return &m->GetError();
  }
  return nullptr;
}

auto JsonRpc::GetFailures() const -> const std::vector<ValidationFailure>* {
  if (const auto* m = std::get_if<Errors>(&message_)) {
    return &m->GetFailures();
  }
  return nullptr;
}

auto JsonRpc::ToJson() const -> Json {
  return std::visit([](const auto& m) { return m.ToJson(); }, message_);
}

auto JsonRpc::Dump() const -> std::string {
  auto json = ToJson();
  if (!json.is_array()) {
    return OrderedMessage(json).dump();
  }
  OrderedJson responses = OrderedJson::array();
  for (const auto& response : json) {
    responses.push_back(OrderedMessage(response));
  }
  return responses.dump();
}

}  // namespace rpcmsg::message
