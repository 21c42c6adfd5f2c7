#pragma once

#include "scalar.hpp"

#include "../codec.hpp"
#include "../protocol.hpp"
#include "../wire_format.hpp"

#include <map>
#include <string>
#include <tuple>
#include <utility>

namespace jrpc::transport {

constexpr int kHttpOk = 200;
constexpr int kHttpInternalServerError = 500;
constexpr const char* kContentTypeHeader = "Content-Type";
constexpr const char* kJsonContentType = "application/json";
constexpr const char* kIdHeader = "X-JSONRPC-ID";

/// Minimal HTTP view of a response: no envelope, the id travels in the X-JSONRPC-ID header.
class HttpResponse {
public:
    using HeaderMap = std::map<std::string, std::string>;

    HttpResponse(int status, HeaderMap headers, std::string body)
        : status_(status), headers_(std::move(headers)), body_(std::move(body)) {}

    /// 200 for a result, 500 for an error.
    int status() const { return status_; }
    const HeaderMap& headers() const { return headers_; }
    HeaderMap& headers_mut() { return headers_; }
    const std::string& body() const { return body_; }

    std::tuple<int, HeaderMap, std::string> into_parts() && {
        return {status_, std::move(headers_), std::move(body_)};
    }

private:
    int status_;
    HeaderMap headers_;
    std::string body_;
};

/// Throws TransportError when the id cannot be a header value or the body cannot be serialized.
HttpResponse make_http_response(const Id& id, bool success, const nlohmann::json& outcome);

template <typename Result, typename Format = wire::DefaultFormat>
HttpResponse to_http_response(const Response<Result>& response) {
    nlohmann::json outcome;
    try {
        outcome = wire::encode_outcome<Format>(response.outcome());
    } catch (const codec::CodecError& exc) {
        throw TransportError(std::string("pack error: ") + exc.what());
    }
    return make_http_response(response.id(), response.outcome().is_ok(), outcome);
}

} // namespace jrpc::transport
