#include <iostream>
#include <iterator>
#include <string>

#include <nlohmann/json.hpp>
#include <rpcmsg/message/batch.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

using rpcmsg::message::JsonRpc;

namespace {

// What a server would send back for one classified message.
void Report(const JsonRpc& message) {
  if (message.IsValid()) {
    spdlog::info(
        "{}: {}", rpcmsg::message::ToString(message.Kind()), message.Dump());
    return;
  }

  for (const auto& failure : *message.GetFailures()) {
    spdlog::warn("invalid: {}", failure.detail);
    auto reply = JsonRpc::MakeError({}, failure.ToRpcError());
    std::cout << reply.Dump() << '\n';
  }
}

}  // namespace

auto main() -> int {
  auto logger = spdlog::stderr_color_mt("inspect");
  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::debug);

  std::string text(
      (std::istreambuf_iterator<char>(std::cin)),
      std::istreambuf_iterator<char>());

  auto incoming = rpcmsg::message::Parse(text);
  if (!incoming) {
    spdlog::error("Parse failed: {}", incoming.error().Message());
    std::cout << JsonRpc::MakeError({}, incoming.error()).Dump() << '\n';
    return 1;
  }

  if (const auto* batch = incoming->GetBatch()) {
    spdlog::info("batch of {} messages", batch->size());
    for (const auto& message : *batch) {
      Report(message);
    }
    return 0;
  }

  Report(*incoming->GetSingle());
  return 0;
}
