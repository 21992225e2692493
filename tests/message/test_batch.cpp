#include <optional>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "rpcmsg/message/batch.hpp"

using rpcmsg::message::Classify;
using rpcmsg::message::Json;
using rpcmsg::message::JsonRpc;
using rpcmsg::message::MessageKind;
using rpcmsg::message::Parse;
using rpcmsg::message::ValidationReason;

TEST_CASE("Classify single values", "[Batch]") {
  SECTION("An object yields a single message") {
    auto incoming =
        Classify(Json::parse(R"({"jsonrpc":"2.0","method":"update"})"));

    REQUIRE_FALSE(incoming.IsBatch());
    REQUIRE(incoming.GetBatch() == nullptr);
    REQUIRE(incoming.GetSingle()->Kind() == MessageKind::kNotification);
  }

  SECTION("A scalar yields a single rejection") {
    auto incoming = Classify(Json(7));

    REQUIRE_FALSE(incoming.IsBatch());
    REQUIRE(
        incoming.GetSingle()->GetFailures()->front().reason ==
        ValidationReason::kNotAnObject);
  }
}

TEST_CASE("Classify batches", "[Batch]") {
  SECTION("Mixed valid and malformed elements keep their order") {
    auto incoming = Classify(Json::parse(
        R"([{"jsonrpc":"2.0","method":"sum","params":[1,2],"id":1},
            {"method":"sum","id":2}])"));

    REQUIRE(incoming.IsBatch());
    const auto& batch = *incoming.GetBatch();
    REQUIRE(batch.size() == 2);
    REQUIRE(batch[0].Kind() == MessageKind::kRequest);
    REQUIRE(batch[1].Kind() == MessageKind::kErrors);
    REQUIRE(
        batch[1].GetFailures()->front().reason ==
        ValidationReason::kInvalidVersion);
  }

  SECTION("Every kind in one batch") {
    auto incoming = Classify(Json::parse(R"([
        {"jsonrpc":"2.0","method":"sum","params":[1,2,4],"id":"1"},
        {"jsonrpc":"2.0","method":"notify_hello","params":[7]},
        {"jsonrpc":"2.0","result":7,"id":"1"},
        {"jsonrpc":"2.0","error":{"code":-32600,"message":"Invalid Request"},"id":null},
        {"foo":"boo"},
        1
    ])"));

    const auto& batch = *incoming.GetBatch();
    REQUIRE(batch.size() == 6);
    REQUIRE(batch[0].Kind() == MessageKind::kRequest);
    REQUIRE(batch[1].Kind() == MessageKind::kNotification);
    REQUIRE(batch[2].Kind() == MessageKind::kSuccess);
    REQUIRE(batch[3].Kind() == MessageKind::kError);
    REQUIRE(batch[4].Kind() == MessageKind::kErrors);
    REQUIRE(
        batch[5].GetFailures()->front().reason ==
        ValidationReason::kNotAnObject);
  }

  SECTION("An empty batch is itself invalid") {
    auto incoming = Classify(Json::array());

    REQUIRE_FALSE(incoming.IsBatch());
    const auto* single = incoming.GetSingle();
    REQUIRE(single->Kind() == MessageKind::kErrors);
    REQUIRE(
        single->GetFailures()->front().reason == ValidationReason::kEmptyBatch);
    REQUIRE(single->GetFailures()->front().raw == Json::array());
  }

  SECTION("An element holding invalid UTF-8 keeps its siblings") {
    auto previous_level = spdlog::get_level();
    spdlog::set_level(spdlog::level::debug);

    Json raw = Json::array();
    raw.push_back({{"jsonrpc", "2.0"}, {"method", "ping"}, {"id", 1}});
    raw.push_back({{"method", "m"}, {"id", "\xff"}});

    std::optional<rpcmsg::message::Incoming> incoming;
    REQUIRE_NOTHROW(incoming.emplace(Classify(raw)));
    spdlog::set_level(previous_level);

    const auto& batch = *incoming->GetBatch();
    REQUIRE(batch.size() == 2);
    REQUIRE(batch[0].Kind() == MessageKind::kRequest);
    REQUIRE(
        batch[1].GetFailures()->front().reason ==
        ValidationReason::kInvalidVersion);
  }

  SECTION("A batch serializes back to an array of messages") {
    std::vector<JsonRpc> messages = {
        JsonRpc::MakeRequest(1, "a"), JsonRpc::MakeSuccess(1, true)};
    rpcmsg::message::Incoming outgoing(messages);

    auto json = outgoing.ToJson();
    REQUIRE(json.is_array());
    REQUIRE(json.size() == 2);
    REQUIRE(Classify(json) == outgoing);
  }
}

TEST_CASE("Parse JSON text", "[Batch]") {
  SECTION("Valid text is classified") {
    auto incoming = Parse(R"({"jsonrpc":"2.0","result":19,"id":1})");

    REQUIRE(incoming.has_value());
    REQUIRE(incoming->GetSingle()->Kind() == MessageKind::kSuccess);
  }

  SECTION("Valid batch text") {
    auto incoming = Parse(
        R"([{"jsonrpc":"2.0","method":"a"},{"jsonrpc":"2.0","method":"b"}])");

    REQUIRE(incoming.has_value());
    REQUIRE(incoming->GetBatch()->size() == 2);
  }

  SECTION("Malformed text is a parse error") {
    auto incoming = Parse(R"({"jsonrpc":"2.0","method")");

    REQUIRE_FALSE(incoming.has_value());
    REQUIRE(incoming.error().Code() == -32700);
    REQUIRE(incoming.error().Message() == "Parse error");
  }

  SECTION("Empty text is a parse error") {
    REQUIRE_FALSE(Parse("").has_value());
  }
}
