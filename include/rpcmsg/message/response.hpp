#pragma once

#include "rpcmsg/error/error.hpp"
#include "rpcmsg/message/types.hpp"

namespace rpcmsg::message {

using error::RpcError;
using error::RpcErrorCode;

class Success {
 public:
  Success(RequestId id, Json result);

  [[nodiscard]] auto GetId() const -> const RequestId& {
    return id_;
  }

  [[nodiscard]] auto GetResult() const -> const Json& {
    return result_;
  }

  [[nodiscard]] auto ToJson() const -> Json;

  auto operator==(const Success& other) const -> bool = default;

 private:
  RequestId id_;
  Json result_;
};

class ErrorResponse {
 public:
  /// `id` is absent when the request id could not be recovered, for
  /// instance after a parse failure.
  ErrorResponse(Id id, RpcError error);

  [[nodiscard]] auto GetId() const -> const Id& {
    return id_;
  }

  [[nodiscard]] auto GetError() const -> const RpcError& {
    return error_;
  }

  [[nodiscard]] auto ToJson() const -> Json;

  auto operator==(const ErrorResponse& other) const -> bool = default;

 private:
  Id id_;
  RpcError error_;
};

}  // namespace rpcmsg::message
