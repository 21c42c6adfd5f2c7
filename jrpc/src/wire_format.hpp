#pragma once

#include "codec.hpp"
#include "error.hpp"
#include "method.hpp"
#include "protocol.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace jrpc::wire {

constexpr const char* kProtocolVersion = "2.0";
constexpr const char* kInvalidProtocolVersion = "Invalid protocol version";

/**
 * Strict JSON-RPC 2.0 envelopes:
 *   {"jsonrpc":"2.0","id":1,"method":"hello","params":{...}}
 *   {"jsonrpc":"2.0","id":1,"result":...} / {"jsonrpc":"2.0","id":1,"error":{"code":-32601,"message":"..."}}
 * Decoding accepts "i", "r" and "e" as aliases and an absent "jsonrpc";
 * a present "jsonrpc" must equal "2.0".
 */
struct Canonical {
    static constexpr const char* kName = "canonical";

    static nlohmann::json encode_request(const Request<MethodCall>& request);
    static Request<MethodCall> decode_request(const nlohmann::json& value);

    static nlohmann::json encode_response(const Response<nlohmann::json>& response);
    static Response<nlohmann::json> decode_response(const nlohmann::json& value);

    /// The outcome member alone: {"result":...} or {"error":{...}}.
    static nlohmann::json encode_outcome(const Outcome<nlohmann::json>& outcome);

    static ProbeRequest probe_request(const nlohmann::json& value);

    /// Error to answer a request that failed to decode, given what the probe recovered.
    static RpcError recovery_error(const ProbeRequest& probe, const std::string& decode_error);
};

/**
 * Space-saving envelopes, not JSON-RPC compatible:
 *   {"i":1,"m":"hello","p":{...}}
 *   {"i":1,"r":...} / {"i":1,"e":{"code":-32601}}
 * No version marker is written; one that is present is accepted and ignored.
 */
struct Compact {
    static constexpr const char* kName = "compact";

    static nlohmann::json encode_request(const Request<MethodCall>& request);
    static Request<MethodCall> decode_request(const nlohmann::json& value);

    static nlohmann::json encode_response(const Response<nlohmann::json>& response);
    static Response<nlohmann::json> decode_response(const nlohmann::json& value);

    static nlohmann::json encode_outcome(const Outcome<nlohmann::json>& outcome);

    static ProbeRequest probe_request(const nlohmann::json& value);

    static RpcError recovery_error(const ProbeRequest& probe, const std::string& decode_error);
};

#ifdef JRPC_CANONICAL
using DefaultFormat = Canonical;
#else
using DefaultFormat = Compact;
#endif

nlohmann::json encode_error(const RpcError& error);
RpcError decode_error(const nlohmann::json& value);

// Typed envelopes go through the untyped ones above.

template <typename Format, typename Method>
nlohmann::json encode_request(const Request<Method>& request) {
    return Format::encode_request(Request<MethodCall>::from_parts(request.id(), request.method().to_call()));
}

template <typename Format, typename Method>
Request<Method> decode_request(const nlohmann::json& value) {
    auto [id, call] = Format::decode_request(value).into_parts();
    try {
        return Request<Method>::from_parts(std::move(id), Method::from_call(call));
    } catch (const nlohmann::json::exception& exc) {
        throw codec::UnpackError(exc.what());
    }
}

template <typename Format, typename Result>
nlohmann::json encode_response(const Response<Result>& response) {
    if (const Result* result = response.outcome().ok()) {
        return Format::encode_response(Response<nlohmann::json>(response.id(), codec::to_value(*result)));
    }
    return Format::encode_response(Response<nlohmann::json>(response.id(), response.outcome().error()));
}

template <typename Format, typename Result>
Response<Result> decode_response(const nlohmann::json& value) {
    auto [id, outcome] = Format::decode_response(value).into_parts();
    if (const nlohmann::json* result = outcome.ok()) {
        return Response<Result>(std::move(id), codec::from_value<Result>(*result));
    }
    return Response<Result>(std::move(id), outcome.error());
}

template <typename Format, typename Result>
nlohmann::json encode_outcome(const Outcome<Result>& outcome) {
    if (const Result* result = outcome.ok()) {
        return Format::encode_outcome(Outcome<nlohmann::json>(codec::to_value(*result)));
    }
    return Format::encode_outcome(Outcome<nlohmann::json>(outcome.error()));
}

} // namespace jrpc::wire

namespace nlohmann {

// Envelopes convert in the build's default wire format, so BasicCodec::pack/unpack accept them.

template <typename Method>
struct adl_serializer<jrpc::Request<Method>> {
    static jrpc::Request<Method> from_json(const json& value) {
        return jrpc::wire::decode_request<jrpc::wire::DefaultFormat, Method>(value);
    }
    static void to_json(json& value, const jrpc::Request<Method>& request) {
        value = jrpc::wire::encode_request<jrpc::wire::DefaultFormat>(request);
    }
};

template <typename Result>
struct adl_serializer<jrpc::Response<Result>> {
    static jrpc::Response<Result> from_json(const json& value) {
        return jrpc::wire::decode_response<jrpc::wire::DefaultFormat, Result>(value);
    }
    static void to_json(json& value, const jrpc::Response<Result>& response) {
        value = jrpc::wire::encode_response<jrpc::wire::DefaultFormat>(response);
    }
};

} // namespace nlohmann
