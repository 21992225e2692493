#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "rpcmsg/error/error.hpp"
#include "rpcmsg/message/errors.hpp"
#include "rpcmsg/message/request.hpp"
#include "rpcmsg/message/response.hpp"
#include "rpcmsg/message/types.hpp"

namespace rpcmsg::message {

enum class MessageKind {
  kRequest,
  kNotification,
  kSuccess,
  kError,
  kErrors,
};

auto ToString(MessageKind kind) -> std::string_view;

class JsonRpc {
 public:
  using Variant =
      std::variant<Request, Notification, Success, ErrorResponse, Errors>;

  JsonRpc(Request request);              // NOLINT
  JsonRpc(Notification notification);    // NOLINT
  JsonRpc(Success success);              // NOLINT
  JsonRpc(ErrorResponse error_response); // NOLINT
  JsonRpc(Errors errors);                // NOLINT

  static auto MakeRequest(RequestId id, std::string method, Params params = {})
      -> JsonRpc;

  static auto MakeNotification(std::string method, Params params = {})
      -> JsonRpc;

  static auto MakeSuccess(RequestId id, Json result) -> JsonRpc;

  static auto MakeError(Id id, RpcError error) -> JsonRpc;

  /// Classifies one JSON value as a single message.
  ///
  /// Never throws and never fails: a value that is not a well-formed
  /// message comes back as the Errors alternative carrying the reason and
  /// the raw value. Objects are checked in this order, first match wins:
  /// request or notification ("method"), success ("result" with an id),
  /// error response ("error").
  static auto FromValue(const Json& raw) -> JsonRpc;

  [[nodiscard]] auto Kind() const -> MessageKind;

  [[nodiscard]] auto IsValid() const -> bool {
    return Kind() != MessageKind::kErrors;
  }

  [[nodiscard]] auto GetVersion() const -> std::optional<std::string_view>;

  /// For an error response the returned Id may itself be absent.
  [[nodiscard]] auto GetId() const -> std::optional<Id>;

  [[nodiscard]] auto GetMethod() const -> std::optional<std::string_view>;

  [[nodiscard]] auto GetParams() const -> const Params*;

  [[nodiscard]] auto GetResult() const -> const Json*;

  [[nodiscard]] auto GetError() const -> const RpcError*;

  [[nodiscard]] auto GetFailures() const
      -> const std::vector<ValidationFailure>*;

  [[nodiscard]] auto Get() const -> const Variant& {
    return message_;
  }

  [[nodiscard]] auto ToJson() const -> Json;

  /// Compact JSON text with "jsonrpc" as the first member. Errors print
  /// as an array of error responses.
  [[nodiscard]] auto Dump() const -> std::string;

  auto operator==(const JsonRpc& other) const -> bool = default;

 private:
  Variant message_;
};

}  // namespace rpcmsg::message

namespace nlohmann {
template <>
struct adl_serializer<rpcmsg::message::JsonRpc> {
  static void to_json(json& j, const rpcmsg::message::JsonRpc& m) {
    j = m.ToJson();
  }
};
}  // namespace nlohmann
