#pragma once

#include <string>

#include "rpcmsg/message/types.hpp"

namespace rpcmsg::message {

class Request {
 public:
  Request(RequestId id, std::string method, Params params = {});

  [[nodiscard]] auto GetId() const -> const RequestId& {
    return id_;
  }

  [[nodiscard]] auto GetMethod() const -> const std::string& {
    return method_;
  }

  [[nodiscard]] auto GetParams() const -> const Params& {
    return params_;
  }

  [[nodiscard]] auto ToJson() const -> Json;

  auto operator==(const Request& other) const -> bool = default;

 private:
  RequestId id_;
  std::string method_;
  Params params_;
};

// A request without an id. The type has no id member at all, so a
// notification can never be confused with a request carrying a null id.
class Notification {
 public:
  explicit Notification(std::string method, Params params = {});

  [[nodiscard]] auto GetMethod() const -> const std::string& {
    return method_;
  }

  [[nodiscard]] auto GetParams() const -> const Params& {
    return params_;
  }

  [[nodiscard]] auto ToJson() const -> Json;

  auto operator==(const Notification& other) const -> bool = default;

 private:
  std::string method_;
  Params params_;
};

}  // namespace rpcmsg::message
