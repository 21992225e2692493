#include "rpcmsg/message/errors.hpp"

#include "rpcmsg/message/response.hpp"

namespace rpcmsg::message {

auto ValidationFailure::ToRpcError() const -> error::RpcError {
  return error::RpcError::InvalidRequest().WithData(
      {{"reason", std::string(ReasonMessage(reason))}, {"detail", detail}});
}

Errors::Errors(std::vector<ValidationFailure> failures)
    : failures_(std::move(failures)) {
}

auto Errors::ToJson() const -> Json {
  Json responses = Json::array();
  for (const auto& failure : failures_) {
    responses.push_back(ErrorResponse(Id{}, failure.ToRpcError()).ToJson());
  }
  return responses;
}

}  // namespace rpcmsg::message
