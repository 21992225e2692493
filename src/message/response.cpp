#include "rpcmsg/message/response.hpp"

namespace rpcmsg::message {

Success::Success(RequestId id, Json result)
    : id_(std::move(id)), result_(std::move(result)) {
}

auto Success::ToJson() const -> Json {
  Json response = {{"jsonrpc", kJsonRpcVersion}, {"result", result_}};
  response["id"] = RequestIdToJson(id_);
  return response;
}

ErrorResponse::ErrorResponse(Id id, RpcError error)
    : id_(std::move(id)), error_(std::move(error)) {
}

auto ErrorResponse::ToJson() const -> Json {
  Json response = {{"jsonrpc", kJsonRpcVersion}, {"error", error_}};
  response["id"] = id_.ToJson();
  return response;
}

}  // namespace rpcmsg::message
