#pragma once

#include <expected>
#include <string_view>
#include <variant>
#include <vector>

#include "rpcmsg/error/error.hpp"
#include "rpcmsg/message/jsonrpc.hpp"

namespace rpcmsg::message {

// A top-level incoming value: either one message or a batch with one
// outcome per element, in input order.
class Incoming {
 public:
  Incoming(JsonRpc single);                  // NOLINT
  Incoming(std::vector<JsonRpc> batch);      // NOLINT

  [[nodiscard]] auto IsBatch() const -> bool {
    return std::holds_alternative<std::vector<JsonRpc>>(value_);
  }

  [[nodiscard]] auto GetSingle() const -> const JsonRpc* {
    return std::get_if<JsonRpc>(&value_);
  }

  [[nodiscard]] auto GetBatch() const -> const std::vector<JsonRpc>* {
    return std::get_if<std::vector<JsonRpc>>(&value_);
  }

  [[nodiscard]] auto ToJson() const -> Json;

  auto operator==(const Incoming& other) const -> bool = default;

 private:
  std::variant<JsonRpc, std::vector<JsonRpc>> value_;
};

/// Classifies a top-level value. Arrays are validated element by
/// element; a malformed element never affects its siblings. An empty
/// array is itself invalid and yields a single Errors outcome.
auto Classify(const Json& raw) -> Incoming;

/// Parses JSON text with nlohmann::json and classifies the result. Text
/// that is not JSON yields a ParseError.
auto Parse(std::string_view text) -> std::expected<Incoming, error::RpcError>;

}  // namespace rpcmsg::message
