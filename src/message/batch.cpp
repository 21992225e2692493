#include "rpcmsg/message/batch.hpp"

#include <spdlog/spdlog.h>

namespace rpcmsg::message {

using error::RpcError;
using error::RpcErrorCode;

Incoming::Incoming(JsonRpc single) : value_(std::move(single)) {
}

Incoming::Incoming(std::vector<JsonRpc> batch) : value_(std::move(batch)) {
}

auto Incoming::ToJson() const -> Json {
  if (const auto* batch = GetBatch()) {
    return *batch;
  }
  return GetSingle()->ToJson();
}

auto Classify(const Json& raw) -> Incoming {
  if (!raw.is_array()) {
    return JsonRpc::FromValue(raw);
  }

  if (raw.empty()) {
    spdlog::debug("Rejected empty JSON-RPC batch");
    return JsonRpc(Errors({ValidationFailure{
        ValidationReason::kEmptyBatch, "Batch must not be empty", raw}}));
  }

  spdlog::debug("Classifying JSON-RPC batch of {} elements", raw.size());
  std::vector<JsonRpc> outcomes;
  outcomes.reserve(raw.size());
  for (const auto& element : raw) {
    outcomes.push_back(JsonRpc::FromValue(element));
  }
  return outcomes;
}

auto Parse(std::string_view text) -> std::expected<Incoming, RpcError> {
  auto root = Json::parse(text, nullptr, false);
  if (root.is_discarded()) {
    spdlog::debug(
        "Failed to parse JSON-RPC text: {}",
        text.substr(0, kMaxLoggedValueLength));
    return RpcError::UnexpectedFromCode(RpcErrorCode::kParseError);
  }
  return Classify(root);
}

}  // namespace rpcmsg::message
