#include "rpcmsg/message/request.hpp"

namespace rpcmsg::message {

Request::Request(RequestId id, std::string method, Params params)
    : id_(std::move(id)),
      method_(std::move(method)),
      params_(std::move(params)) {
}

auto Request::ToJson() const -> Json {
  Json json_obj;
  json_obj["jsonrpc"] = kJsonRpcVersion;
  json_obj["method"] = method_;

  if (!params_.IsAbsent()) {
    json_obj["params"] = params_.ToJson();
  }

  json_obj["id"] = RequestIdToJson(id_);
  return json_obj;
}

Notification::Notification(std::string method, Params params)
    : method_(std::move(method)), params_(std::move(params)) {
}

auto Notification::ToJson() const -> Json {
  Json json_obj;
  json_obj["jsonrpc"] = kJsonRpcVersion;
  json_obj["method"] = method_;

  if (!params_.IsAbsent()) {
    json_obj["params"] = params_.ToJson();
  }

  return json_obj;
}

}  // namespace rpcmsg::message
