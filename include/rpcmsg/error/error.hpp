#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace rpcmsg::error {

// Any value outside the named ones is an implementation-defined server
// error; the underlying type keeps the exact integer.
enum class RpcErrorCode : int64_t {
  kParseError = -32700,
  kInvalidRequest = -32600,
  kMethodNotFound = -32601,
  kInvalidParams = -32602,
  kInternalError = -32603,
};

constexpr std::string_view kServerErrorMessage = "Server error";

constexpr auto ErrorCodeFromInteger(int64_t code) -> RpcErrorCode {
  return static_cast<RpcErrorCode>(code);
}

constexpr auto ToInteger(RpcErrorCode code) -> int64_t {
  return static_cast<int64_t>(code);
}

constexpr auto IsServerError(RpcErrorCode code) -> bool {
  switch (code) {
    case RpcErrorCode::kParseError:
    case RpcErrorCode::kInvalidRequest:
    case RpcErrorCode::kMethodNotFound:
    case RpcErrorCode::kInvalidParams:
    case RpcErrorCode::kInternalError:
      return false;
  }
  return true;
}

constexpr auto DefaultMessageFor(RpcErrorCode code) -> std::string_view {
  switch (code) {
    case RpcErrorCode::kParseError:
      return "Parse error";
    case RpcErrorCode::kInvalidRequest:
      return "Invalid Request";
    case RpcErrorCode::kMethodNotFound:
      return "Method not found";
    case RpcErrorCode::kInvalidParams:
      return "Invalid params";
    case RpcErrorCode::kInternalError:
      return "Internal error";
  }
  return kServerErrorMessage;
}

// JSON-RPC error object. Also the error type carried by std::expected
// wherever an operation of this library can fail.
class RpcError {
 public:
  RpcError(
      int64_t code, std::string message,
      std::optional<nlohmann::json> data = std::nullopt);

  RpcError(
      RpcErrorCode code, std::string message,
      std::optional<nlohmann::json> data = std::nullopt);

  static auto FromCode(
      RpcErrorCode code, std::optional<nlohmann::json> data = std::nullopt)
      -> RpcError;

  static auto UnexpectedFromCode(RpcErrorCode code, std::string message = "")
      -> std::unexpected<RpcError>;

  static auto ParseError() -> RpcError;
  static auto InvalidRequest() -> RpcError;
  static auto MethodNotFound() -> RpcError;
  static auto InvalidParams() -> RpcError;
  static auto InternalError() -> RpcError;
  /// Always "Server error", whatever `code` is. Use FromCode() for the
  /// reserved codes.
  static auto ServerError(int64_t code) -> RpcError;

  /// Reads an error object. Returns std::nullopt unless `code` is an
  /// integer that fits in int64_t and `message` is a string.
  static auto FromJson(const nlohmann::json& json)
      -> std::optional<RpcError>;

  [[nodiscard]] auto WithData(nlohmann::json data) const -> RpcError;

  [[nodiscard]] auto Code() const -> int64_t {
    return code_;
  }

  [[nodiscard]] auto ErrorCode() const -> RpcErrorCode {
    return ErrorCodeFromInteger(code_);
  }

  [[nodiscard]] auto Message() const -> std::string_view {
    return message_;
  }

  [[nodiscard]] auto Data() const -> const std::optional<nlohmann::json>& {
    return data_;
  }

  [[nodiscard]] auto ToJson() const -> nlohmann::json;

  /// Compact JSON text with `code`, `message` and `data` in that order.
  [[nodiscard]] auto Dump() const -> std::string;

  auto operator==(const RpcError& other) const -> bool = default;

 private:
  int64_t code_;
  std::string message_;
  std::optional<nlohmann::json> data_;
};

}  // namespace rpcmsg::error

namespace nlohmann {
template <>
struct adl_serializer<rpcmsg::error::RpcError> {
  static void to_json(json& j, const rpcmsg::error::RpcError& e) {
    j = e.ToJson();
  }
};
}  // namespace nlohmann
