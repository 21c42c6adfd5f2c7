#include <gtest/gtest.h>

#include "demo/demo_rpc.hpp"
#include "test_helpers.hpp"
#include "transport/http_response.hpp"

using jrpc::Response;
using jrpc::demo::DemoResult;
using jrpc::transport::HttpResponse;
using nlohmann::json;

TEST(HttpResponse, SuccessIs200WithBareResult) {
    Response<DemoResult> response(jrpc::make_id(7), DemoResult::from_text("Hello, world"));
    auto http = jrpc::transport::to_http_response<DemoResult, jrpc::wire::Canonical>(response);

    EXPECT_EQ(http.status(), 200);
    EXPECT_EQ(http.headers().at("Content-Type"), "application/json");
    EXPECT_EQ(http.headers().at("X-JSONRPC-ID"), "7");
    EXPECT_EQ(json::parse(http.body()), json::parse(R"({"result":"Hello, world"})"));
}

TEST(HttpResponse, ErrorIs500WithBareError) {
    Response<DemoResult> response(jrpc::make_id(8),
                                  jrpc::RpcError::make(jrpc::ErrorKind::custom(-32000), jrpc::String("not implemented")));
    auto http = jrpc::transport::to_http_response<DemoResult, jrpc::wire::Compact>(response);

    EXPECT_EQ(http.status(), 500);
    EXPECT_EQ(http.headers().at(jrpc::transport::kIdHeader), "8");
    EXPECT_EQ(json::parse(http.body()), json::parse(R"({"e":{"code":-32000,"message":"not implemented"}})"));
}

TEST(HttpResponse, PartsCanBeTakenApart) {
    Response<DemoResult> response(jrpc::make_id(1), DemoResult::general(false));
    auto http = jrpc::transport::to_http_response(response);
    http.headers_mut()["Cache-Control"] = "no-store";

    auto [status, headers, body] = std::move(http).into_parts();
    EXPECT_EQ(status, jrpc::transport::kHttpOk);
    EXPECT_EQ(headers.size(), 3u);
    EXPECT_EQ(headers.at("Cache-Control"), "no-store");
    EXPECT_NE(body.find("\"ok\":false"), std::string::npos);
}

TEST(HttpResponse, UnencodableBodyIsTransportError) {
    Response<json> response(jrpc::make_id(1), json(std::string("\xff")));
    EXPECT_THROW(jrpc::transport::to_http_response(response), jrpc::transport::TransportError);
}

#ifndef JRPC_CONSTRAINED
TEST(HttpResponse, StringIdIsWrittenUnquoted) {
    Response<json> response(json("req-1"), json(true));
    auto http = jrpc::transport::to_http_response(response);
    EXPECT_EQ(http.headers().at(jrpc::transport::kIdHeader), "req-1");
}

TEST(HttpResponse, ControlCharactersInIdAreRejected) {
    Response<json> response(json("bad\nid"), json(true));
    EXPECT_THROW(jrpc::transport::to_http_response(response), jrpc::transport::TransportError);
}
#endif
