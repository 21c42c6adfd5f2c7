#include <gtest/gtest.h>

#include "client.hpp"
#include "demo/demo_rpc.hpp"
#include "json_codec.hpp"
#include "msgpack_codec.hpp"
#include "test_helpers.hpp"

#include <mutex>
#include <set>
#include <thread>
#include <vector>

using jrpc::demo::DemoMethod;
using jrpc::demo::DemoResult;
using nlohmann::json;

namespace {

using CanonicalClient = jrpc::RpcClient<jrpc::codec::Json, DemoMethod, DemoResult, jrpc::wire::Canonical>;
using CompactClient = jrpc::RpcClient<jrpc::codec::Json, DemoMethod, DemoResult, jrpc::wire::Compact>;

} // namespace

TEST(RpcClient, IdsStartAtZeroAndIncrement) {
    CanonicalClient client;
    auto first = client.request(DemoMethod::test());
    auto second = client.request(DemoMethod::hello("x"));

    ASSERT_TRUE(first.id());
    ASSERT_TRUE(second.id());
    EXPECT_EQ(*first.id(), 0u);
    EXPECT_EQ(*second.id(), 1u);
    EXPECT_EQ(decode_bytes<jrpc::codec::Json>(first.payload()),
              json::parse(R"({"jsonrpc":"2.0","id":0,"method":"test","params":{}})"));
    EXPECT_EQ(decode_bytes<jrpc::codec::Json>(second.payload()),
              json::parse(R"({"jsonrpc":"2.0","id":1,"method":"hello","params":{"name":"x"}})"));
}

TEST(RpcClient, FireAndForgetDoesNotConsumeAnId) {
    CompactClient client;
    auto notification = client.request_fire_and_forget(DemoMethod::list("a"));
    auto call = client.request(DemoMethod::test());

    EXPECT_FALSE(notification.id());
    EXPECT_EQ(decode_bytes<jrpc::codec::Json>(notification.payload()), json::parse(R"({"m":"list","p":{"i":"a"}})"));
    EXPECT_EQ(*call.id(), 0u);
}

TEST(RpcClient, FireAndForgetCannotResolveResponses) {
    CompactClient client;
    auto notification = client.request_fire_and_forget(DemoMethod::test());
    auto result = notification.handle_response(to_bytes(R"({"i":0,"r":{"ok":true}})"));
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error(), jrpc::RpcError::make(jrpc::ErrorKind::InvalidRequest, jrpc::String(jrpc::kNoRequestId)));
}

TEST(RpcClient, ResolvesMatchingResponse) {
    CompactClient client;
    auto call = client.request(DemoMethod::hello("x"));
    auto result = call.handle_response(to_bytes(R"({"i":0,"r":"Hello, x"})"));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), DemoResult::from_text("Hello, x"));
}

TEST(RpcClient, ServerErrorsPassThrough) {
    CanonicalClient client;
    auto call = client.request(DemoMethod::complicated());
    auto result = call.handle_response(
        to_bytes(R"({"jsonrpc":"2.0","id":0,"error":{"code":-32000,"message":"Complicated method not implemented"}})"));
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind(), jrpc::ErrorKind::custom(-32000));
    EXPECT_EQ(message_of(result.error()), "Complicated method not implemented");
}

TEST(RpcClient, MismatchedIdIsInvalidRequest) {
    CompactClient client;
    auto call = client.request(DemoMethod::test());
    auto result = call.handle_response(to_bytes(R"({"i":5,"r":{"ok":true}})"));
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error(), jrpc::RpcError::make(jrpc::ErrorKind::InvalidRequest, jrpc::String(jrpc::kResponseIdMismatch)));
}

TEST(RpcClient, UndecodableResponseIsParseError) {
    CompactClient client;
    auto call = client.request(DemoMethod::test());

    auto garbage = call.handle_response(to_bytes("not json"));
    ASSERT_TRUE(garbage.is_err());
    EXPECT_EQ(garbage.error().kind(), jrpc::ErrorKind(jrpc::ErrorKind::ParseError));
    EXPECT_FALSE(message_of(garbage.error()).empty());

    // well-formed envelope, result of the wrong shape
    auto wrong_shape = call.handle_response(to_bytes(R"({"i":0,"r":[1,2]})"));
    ASSERT_TRUE(wrong_shape.is_err());
    EXPECT_EQ(wrong_shape.error().kind(), jrpc::ErrorKind(jrpc::ErrorKind::ParseError));
}

TEST(RpcClient, TakePayloadLeavesEmptyBuffer) {
    CompactClient client;
    auto call = client.request(DemoMethod::test());
    auto payload = call.take_payload();
    EXPECT_FALSE(payload.empty());
    EXPECT_TRUE(call.payload().empty());
    EXPECT_EQ(*call.id(), 0u);
}

TEST(RpcClient, MsgpackRequestsCarryTheSameEnvelope) {
    jrpc::RpcClient<jrpc::codec::Msgpack, DemoMethod, DemoResult, jrpc::wire::Compact> client;
    auto call = client.request(DemoMethod::hello("x"));
    EXPECT_EQ(decode_bytes<jrpc::codec::Msgpack>(call.payload()), json::parse(R"({"i":0,"m":"hello","p":{"name":"x"}})"));

    auto response = jrpc::codec::Msgpack::encode(json::parse(R"({"i":0,"r":"Hello, x"})"));
    EXPECT_EQ(call.handle_response(response).value(), DemoResult::from_text("Hello, x"));
}

TEST(RpcClient, ConcurrentCallsGetDistinctIds) {
    CompactClient client;
    std::mutex mutex;
    std::set<std::uint32_t> ids;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 250; ++i) {
                auto call = client.request(DemoMethod::test());
                std::lock_guard<std::mutex> lock(mutex);
                ids.insert(*call.id());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(ids.size(), 1000u);
    EXPECT_EQ(*ids.begin(), 0u);
    EXPECT_EQ(*ids.rbegin(), 999u);
}
