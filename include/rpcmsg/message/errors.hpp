#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "rpcmsg/error/error.hpp"
#include "rpcmsg/message/types.hpp"

namespace rpcmsg::message {

enum class ValidationReason {
  kNotAnObject,
  kInvalidVersion,
  kUnrecognizedShape,
  kFieldTypeMismatch,
  kIdTypeMismatch,
  kEmptyBatch,
};

constexpr auto ReasonMessage(ValidationReason reason) -> std::string_view {
  switch (reason) {
    case ValidationReason::kNotAnObject:
      return "Message is not a JSON object";
    case ValidationReason::kInvalidVersion:
      return "Missing or invalid 'jsonrpc' version";
    case ValidationReason::kUnrecognizedShape:
      return "Object matches no JSON-RPC message shape";
    case ValidationReason::kFieldTypeMismatch:
      return "Field has the wrong type";
    case ValidationReason::kIdTypeMismatch:
      return "Invalid 'id' type";
    case ValidationReason::kEmptyBatch:
      return "Batch is empty";
  }
  return "Unknown validation failure";
}

// Why a raw value was rejected, together with the value itself so the
// caller can report it back.
struct ValidationFailure {
  ValidationReason reason;
  std::string detail;
  Json raw;

  /// InvalidRequest error whose data carries the reason and detail.
  [[nodiscard]] auto ToRpcError() const -> error::RpcError;

  auto operator==(const ValidationFailure& other) const -> bool = default;
};

// Result of validating something that is not a well-formed message. Never
// sent on the wire as such.
class Errors {
 public:
  explicit Errors(std::vector<ValidationFailure> failures);

  [[nodiscard]] auto GetFailures() const
      -> const std::vector<ValidationFailure>& {
    return failures_;
  }

  /// One InvalidRequest error response with a null id per failure.
  [[nodiscard]] auto ToJson() const -> Json;

  auto operator==(const Errors& other) const -> bool = default;

 private:
  std::vector<ValidationFailure> failures_;
};

}  // namespace rpcmsg::message
