#include <gtest/gtest.h>

#include "demo/demo_rpc.hpp"
#include "json_codec.hpp"
#include "msgpack_codec.hpp"
#include "test_helpers.hpp"
#include "wire_format.hpp"

#include <functional>
#include <string>

using jrpc::MethodCall;
using jrpc::Request;
using jrpc::Response;
using jrpc::demo::DemoMethod;
using jrpc::demo::DemoResult;
using jrpc::wire::Canonical;
using jrpc::wire::Compact;
using nlohmann::json;

namespace {

Request<MethodCall> hello_request(std::uint32_t id) {
    return Request<MethodCall>(jrpc::make_id(id), MethodCall{"hello", {{"name", "world"}}});
}

std::string unpack_message(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const jrpc::codec::UnpackError& exc) {
        return exc.what();
    }
    return "";
}

} // namespace

TEST(CanonicalFormat, EncodesRequestWithMarker) {
    auto value = Canonical::encode_request(hello_request(1));
    EXPECT_EQ(value, json::parse(R"({"jsonrpc":"2.0","id":1,"method":"hello","params":{"name":"world"}})"));
}

TEST(CanonicalFormat, FireAndForgetOmitsId) {
    auto value = Canonical::encode_request(Request<MethodCall>::fire_and_forget(MethodCall{"test", nullptr}));
    EXPECT_EQ(value, json::parse(R"({"jsonrpc":"2.0","method":"test"})"));
}

TEST(CanonicalFormat, DecodesAliasesAndMissingMarker) {
    auto request = Canonical::decode_request(json::parse(R"({"i":7,"method":"hello","params":{"name":"x"}})"));
    ASSERT_TRUE(request.id());
    EXPECT_EQ(*request.id(), jrpc::make_id(7));
    EXPECT_EQ(request.method().name, "hello");
    EXPECT_EQ(request.method().params, json::parse(R"({"name":"x"})"));
}

TEST(CanonicalFormat, NullIdMeansFireAndForget) {
    auto request = Canonical::decode_request(json::parse(R"({"jsonrpc":"2.0","id":null,"method":"test"})"));
    EXPECT_FALSE(request.expects_response());
    EXPECT_TRUE(request.method().params.is_null());
}

TEST(CanonicalFormat, RejectsOtherProtocolVersions) {
    auto message = unpack_message([] { Canonical::decode_request(json::parse(R"({"jsonrpc":"1.0","id":1,"method":"test"})")); });
    EXPECT_EQ(message, jrpc::wire::kInvalidProtocolVersion);
    EXPECT_THROW(Canonical::decode_response(json::parse(R"({"jsonrpc":"3.0","id":1,"result":1})")),
                 jrpc::codec::UnpackError);
}

TEST(CanonicalFormat, RejectsUnknownAndDuplicateFields) {
    auto unknown = unpack_message([] { Canonical::decode_request(json::parse(R"({"id":1,"method":"test","extra":1})")); });
    EXPECT_NE(unknown.find("unknown field `extra`"), std::string::npos);

    auto duplicate = unpack_message([] { Canonical::decode_request(json::parse(R"({"id":1,"i":2,"method":"test"})")); });
    EXPECT_NE(duplicate.find("duplicate field"), std::string::npos);

    EXPECT_EQ(unpack_message([] { Canonical::decode_request(json::parse(R"({"id":1})")); }), "missing field `method`");
    EXPECT_THROW(Canonical::decode_request(json::parse(R"({"id":1,"method":5})")), jrpc::codec::UnpackError);
    EXPECT_THROW(Canonical::decode_request(json::parse(R"([1,2])")), jrpc::codec::UnpackError);
}

TEST(CanonicalFormat, RejectsStructuredIds) {
    EXPECT_THROW(Canonical::decode_request(json::parse(R"({"id":[1],"method":"test"})")), jrpc::codec::UnpackError);
    EXPECT_THROW(Canonical::decode_request(json::parse(R"({"id":{"a":1},"method":"test"})")), jrpc::codec::UnpackError);
}

TEST(CanonicalFormat, ResponseCarriesExactlyOneOutcome) {
    auto ok = Canonical::decode_response(json::parse(R"({"jsonrpc":"2.0","id":1,"result":{"ok":true}})"));
    EXPECT_EQ(ok.id(), jrpc::make_id(1));
    ASSERT_TRUE(ok.outcome().is_ok());
    EXPECT_EQ(ok.outcome().value(), json::parse(R"({"ok":true})"));

    auto err = Canonical::decode_response(json::parse(R"({"id":1,"e":{"code":-32601,"message":"nope"}})"));
    ASSERT_TRUE(err.outcome().is_err());
    EXPECT_EQ(err.outcome().error().kind(), jrpc::ErrorKind(jrpc::ErrorKind::MethodNotFound));
    EXPECT_EQ(message_of(err.outcome().error()), "nope");

    EXPECT_THROW(Canonical::decode_response(json::parse(R"({"id":1,"result":1,"error":{"code":1}})")),
                 jrpc::codec::UnpackError);
    EXPECT_THROW(Canonical::decode_response(json::parse(R"({"id":1})")), jrpc::codec::UnpackError);
    EXPECT_THROW(Canonical::decode_response(json::parse(R"({"result":1})")), jrpc::codec::UnpackError);
}

TEST(CanonicalFormat, NullResultIsASuccess) {
    auto response = Canonical::decode_response(json::parse(R"({"jsonrpc":"2.0","id":4,"result":null})"));
    ASSERT_TRUE(response.outcome().is_ok());
    EXPECT_TRUE(response.outcome().value().is_null());
}

TEST(CanonicalFormat, EncodesErrorResponse) {
    Response<json> response(jrpc::make_id(2), jrpc::RpcError::make(jrpc::ErrorKind::custom(-32000), jrpc::String("busy")));
    EXPECT_EQ(Canonical::encode_response(response),
              json::parse(R"({"jsonrpc":"2.0","id":2,"error":{"code":-32000,"message":"busy"}})"));
}

TEST(CanonicalFormat, RecoveryErrorFollowsMarker) {
    jrpc::ProbeRequest probe;
    probe.id = jrpc::make_id(1);
    EXPECT_EQ(Canonical::recovery_error(probe, "bad"), jrpc::RpcError::make(jrpc::ErrorKind::InvalidRequest));

    probe.jsonrpc = "2.0";
    EXPECT_EQ(Canonical::recovery_error(probe, "bad"),
              jrpc::RpcError::make(jrpc::ErrorKind::MethodNotFound, jrpc::String("bad")));

    probe.jsonrpc = "1.0";
    EXPECT_EQ(Canonical::recovery_error(probe, "bad"),
              jrpc::RpcError::make(jrpc::ErrorKind::InvalidRequest, jrpc::String(jrpc::wire::kInvalidProtocolVersion)));
}

TEST(CompactFormat, EncodesShortKeysWithoutMarker) {
    EXPECT_EQ(Compact::encode_request(hello_request(3)), json::parse(R"({"i":3,"m":"hello","p":{"name":"world"}})"));

    Response<json> response(jrpc::make_id(3), json("Hello, world"));
    EXPECT_EQ(Compact::encode_response(response), json::parse(R"({"i":3,"r":"Hello, world"})"));

    Response<json> failed(jrpc::make_id(3), jrpc::RpcError::make(jrpc::ErrorKind::ParseError));
    EXPECT_EQ(Compact::encode_response(failed), json::parse(R"({"i":3,"e":{"code":-32700}})"));
}

TEST(CompactFormat, ToleratesIdAliasAndMarker) {
    auto request = Compact::decode_request(json::parse(R"({"jsonrpc":"whatever","id":9,"m":"test"})"));
    ASSERT_TRUE(request.id());
    EXPECT_EQ(*request.id(), jrpc::make_id(9));
    EXPECT_EQ(request.method().name, "test");

    EXPECT_THROW(Compact::decode_request(json::parse(R"({"jsonrpc":5,"i":9,"m":"test"})")), jrpc::codec::UnpackError);
    EXPECT_THROW(Compact::decode_request(json::parse(R"({"i":1,"id":2,"m":"test"})")), jrpc::codec::UnpackError);
}

TEST(CompactFormat, RejectsCanonicalKeys) {
    auto message = unpack_message([] { Compact::decode_request(json::parse(R"({"i":1,"method":"test"})")); });
    EXPECT_NE(message.find("unknown field `method`"), std::string::npos);
    EXPECT_EQ(unpack_message([] { Compact::decode_request(json::parse(R"({"i":1})")); }), "missing field `m`");
    EXPECT_THROW(Compact::decode_response(json::parse(R"({"i":1,"result":1})")), jrpc::codec::UnpackError);
}

TEST(CompactFormat, ResponseCarriesExactlyOneOutcome) {
    EXPECT_THROW(Compact::decode_response(json::parse(R"({"i":1,"r":1,"e":{"code":1}})")), jrpc::codec::UnpackError);
    EXPECT_THROW(Compact::decode_response(json::parse(R"({"i":1})")), jrpc::codec::UnpackError);
    EXPECT_THROW(Compact::decode_response(json::parse(R"({"r":1})")), jrpc::codec::UnpackError);

    auto response = Compact::decode_response(json::parse(R"({"id":1,"e":{"code":-32603,"message":null}})"));
    ASSERT_TRUE(response.outcome().is_err());
    EXPECT_EQ(response.outcome().error(), jrpc::RpcError::make(jrpc::ErrorKind::InternalError));
}

TEST(CompactFormat, RecoveryErrorIsAlwaysMethodNotFound) {
    jrpc::ProbeRequest probe;
    probe.id = jrpc::make_id(1);
    probe.jsonrpc = "1.0";
    EXPECT_EQ(Compact::recovery_error(probe, "unknown variant `x`"),
              jrpc::RpcError::make(jrpc::ErrorKind::MethodNotFound, jrpc::String("unknown variant `x`")));
}

TEST(ErrorObject, DecodeValidatesCode) {
    EXPECT_EQ(jrpc::wire::decode_error(json::parse(R"({"code":-32602,"data":[1]})")),
              jrpc::RpcError::make(jrpc::ErrorKind::InvalidParams));
    EXPECT_EQ(jrpc::wire::decode_error(json::parse(R"({"code":17,"message":"odd"})")),
              jrpc::RpcError::make(jrpc::ErrorKind::custom(17), jrpc::String("odd")));
    EXPECT_THROW(jrpc::wire::decode_error(json::parse(R"({"code":40000})")), jrpc::codec::UnpackError);
    EXPECT_THROW(jrpc::wire::decode_error(json::parse(R"({"code":-40000})")), jrpc::codec::UnpackError);
    EXPECT_THROW(jrpc::wire::decode_error(json::parse(R"({"code":1.5})")), jrpc::codec::UnpackError);
    EXPECT_THROW(jrpc::wire::decode_error(json::parse(R"({"message":"x"})")), jrpc::codec::UnpackError);
    EXPECT_THROW(jrpc::wire::decode_error(json::parse(R"({"code":1,"message":2})")), jrpc::codec::UnpackError);
}

TEST(TypedEnvelopes, DecodeBindsApplicationMethods) {
    auto request = jrpc::wire::decode_request<Canonical, DemoMethod>(
        json::parse(R"({"jsonrpc":"2.0","id":1,"method":"hello","params":{"name":"world"}})"));
    EXPECT_EQ(request.method(), DemoMethod::hello("world"));

    auto message = unpack_message([] {
        jrpc::wire::decode_request<Canonical, DemoMethod>(
            json::parse(R"({"jsonrpc":"2.0","id":3,"method":"test","params":{"abc":123}})"));
    });
    EXPECT_EQ(message, "unknown field `abc`");

    EXPECT_EQ(unpack_message([] { jrpc::wire::decode_request<Compact, DemoMethod>(json::parse(R"({"i":1,"m":"nope"})")); }),
              "unknown variant `nope`");
    EXPECT_THROW((jrpc::wire::decode_request<Compact, DemoMethod>(json::parse(R"({"i":1,"m":"hello","p":{"name":5}})"))),
                 jrpc::codec::UnpackError);
}

TEST(TypedEnvelopes, ResultsConvertThroughJson) {
    Response<DemoResult> response(jrpc::make_id(1), DemoResult::general(true));
    EXPECT_EQ(jrpc::wire::encode_response<Compact>(response), json::parse(R"({"i":1,"r":{"ok":true}})"));

    auto decoded = jrpc::wire::decode_response<Canonical, DemoResult>(json::parse(R"({"id":1,"result":"Hello, x"})"));
    EXPECT_EQ(decoded.outcome().value(), DemoResult::from_text("Hello, x"));

    EXPECT_THROW((jrpc::wire::decode_response<Canonical, DemoResult>(json::parse(R"({"id":1,"result":[1]})"))),
                 jrpc::codec::UnpackError);
}

TEST(TypedEnvelopes, DefaultFormatDrivesJsonConversion) {
    auto request = Request<DemoMethod>(jrpc::make_id(5), DemoMethod::list("a"));
    json value = request;
    EXPECT_EQ(value, jrpc::wire::encode_request<jrpc::wire::DefaultFormat>(request));
    EXPECT_EQ(value.get<Request<DemoMethod>>(), request);
}

#ifndef JRPC_CONSTRAINED
TEST(CanonicalFormat, AcceptsStringAndNegativeIds) {
    auto request = Canonical::decode_request(json::parse(R"({"id":"abc","method":"test"})"));
    EXPECT_EQ(*request.id(), json("abc"));

    auto negative = Compact::decode_request(json::parse(R"({"i":-4,"m":"test"})"));
    EXPECT_EQ(*negative.id(), json(-4));
}
#else
TEST(CanonicalFormat, ConstrainedIdsAreUnsigned) {
    EXPECT_THROW(Canonical::decode_request(json::parse(R"({"id":"abc","method":"test"})")), jrpc::codec::UnpackError);
    EXPECT_THROW(Compact::decode_request(json::parse(R"({"i":-4,"m":"test"})")), jrpc::codec::UnpackError);
}
#endif

TEST(ResponseEnvelope, IntoErrorResponseKeepsTheId) {
    Response<DemoResult> response(jrpc::make_id(3), DemoResult::general(true));
    auto failed = std::move(response).into_error_response(
        jrpc::RpcError::make(jrpc::ErrorKind::InvalidParams, jrpc::String("bad name")));
    EXPECT_EQ(failed.id(), jrpc::make_id(3));
    ASSERT_TRUE(failed.outcome().is_err());
    EXPECT_EQ(failed.outcome().error(), jrpc::RpcError::make(jrpc::ErrorKind::InvalidParams, jrpc::String("bad name")));
}

TEST(ResponseEnvelope, IntoInternalErrorKeepsTheId) {
    Response<DemoResult> response(jrpc::make_id(4), DemoResult::from_text("unused"));
    auto failed = std::move(response).into_internal_error(jrpc::String("encoder broke"));
    EXPECT_EQ(failed, Response<DemoResult>::from_internal_error(jrpc::make_id(4), jrpc::String("encoder broke")));
    EXPECT_EQ(failed.outcome().error().kind(), jrpc::ErrorKind(jrpc::ErrorKind::InternalError));
    EXPECT_EQ(message_of(failed.outcome().error()), "encoder broke");
}

namespace {

template <typename F, typename C>
struct Envelope {
    using Format = F;
    using Codec = C;
};

template <typename Setup, typename Result>
Response<Result> through_wire(const Response<Result>& response) {
    auto bytes = Setup::Codec::encode(jrpc::wire::encode_response<typename Setup::Format>(response));
    return jrpc::wire::decode_response<typename Setup::Format, Result>(decode_bytes<typename Setup::Codec>(bytes));
}

template <typename Setup, typename Method>
Request<Method> through_wire(const Request<Method>& request) {
    auto bytes = Setup::Codec::encode(jrpc::wire::encode_request<typename Setup::Format>(request));
    return jrpc::wire::decode_request<typename Setup::Format, Method>(decode_bytes<typename Setup::Codec>(bytes));
}

} // namespace

template <typename Setup>
class EnvelopeRoundTrip : public ::testing::Test {};

using EnvelopeSetups = ::testing::Types<Envelope<Canonical, jrpc::codec::Json>, Envelope<Canonical, jrpc::codec::Msgpack>,
                                        Envelope<Compact, jrpc::codec::Json>, Envelope<Compact, jrpc::codec::Msgpack>>;
TYPED_TEST_SUITE(EnvelopeRoundTrip, EnvelopeSetups);

TYPED_TEST(EnvelopeRoundTrip, SuccessfulResponses) {
    Response<DemoResult> general(jrpc::make_id(1), DemoResult::general(true));
    EXPECT_EQ(through_wire<TypeParam>(general), general);

    Response<DemoResult> text(jrpc::make_id(2), DemoResult::from_text("Hello, world"));
    EXPECT_EQ(through_wire<TypeParam>(text), text);
}

TYPED_TEST(EnvelopeRoundTrip, ErrorResponses) {
    Response<DemoResult> custom(jrpc::make_id(3), jrpc::RpcError::make(jrpc::ErrorKind::custom(-32000),
                                                                      jrpc::String("Complicated method not implemented")));
    EXPECT_EQ(through_wire<TypeParam>(custom), custom);

    Response<DemoResult> bare(jrpc::make_id(4), jrpc::RpcError::make(jrpc::ErrorKind::InvalidParams));
    EXPECT_EQ(through_wire<TypeParam>(bare), bare);
}

TYPED_TEST(EnvelopeRoundTrip, RequestsWithAndWithoutId) {
    Request<DemoMethod> call(jrpc::make_id(7), DemoMethod::hello("world"));
    EXPECT_EQ(through_wire<TypeParam>(call), call);

    Request<DemoMethod> bare(jrpc::make_id(8), DemoMethod::test());
    EXPECT_EQ(through_wire<TypeParam>(bare), bare);

    auto notification = Request<DemoMethod>::fire_and_forget(DemoMethod::list("items"));
    auto decoded = through_wire<TypeParam>(notification);
    EXPECT_FALSE(decoded.id());
    EXPECT_EQ(decoded, notification);
}
