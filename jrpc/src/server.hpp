#pragma once

#include "codec.hpp"
#include "error.hpp"
#include "logger.hpp"
#include "protocol.hpp"
#include "wire_format.hpp"

#include <log4cplus/loggingmacros.h>

#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <utility>

namespace jrpc {

namespace detail {

/// Encodes a response; when that fails, tries once more with an InternalError carrying the encoder's message.
template <typename Codec, typename Format, typename Result>
std::optional<codec::Bytes> pack_response(const Response<Result>& response) {
    try {
        return Codec::encode(wire::encode_response<Format>(response));
    } catch (const std::exception& exc) {
        LOG4CPLUS_ERROR(server_logger(), "Failed to serialize response: " << exc.what());
        try {
            return Codec::encode(
                wire::encode_response<Format>(Response<Result>::from_internal_error(response.id(), String(exc.what()))));
        } catch (const std::exception& fallback_exc) {
            LOG4CPLUS_ERROR(server_logger(), "Failed to serialize error response: " << fallback_exc.what());
            return std::nullopt;
        }
    }
}

} // namespace detail

/**
 * Server side of the protocol. Implementations provide handle(); the dispatch
 * around it decodes payloads, answers calls that carry an id and recovers
 * what it can from payloads that do not decode.
 *
 * Source is anything printable with operator<< (peer address, connection tag).
 * Instances hold no per-call state and may dispatch from several threads at once.
 */
template <typename Method, typename Result, typename Source, typename Format = wire::DefaultFormat>
class RpcServer {
public:
    using MethodType = Method;
    using ResultType = Result;
    using SourceType = Source;

    virtual ~RpcServer() = default;

    virtual RpcResult<Result> handle(Method method, const Source& source) = 0;

    /// Runs the handler; returns the response for calls with an id and nothing for fire-and-forget calls.
    std::optional<Response<Result>> handle_request(Request<Method> request, const Source& source) {
        auto [id, method] = std::move(request).into_parts();
        LOG4CPLUS_DEBUG(server_logger(), "Dispatching " << (id ? "call" : "fire-and-forget call") << " from " << source);
        RpcResult<Result> outcome = invoke(std::move(method), source);
        if (!id) {
            return std::nullopt;
        }
        return Response<Result>::from_outcome(std::move(*id), std::move(outcome));
    }

    /// Full dispatch of one inbound payload. An empty result means nothing is sent back.
    template <typename Codec>
    std::optional<codec::Bytes> handle_request_payload(const std::uint8_t* data, std::size_t size, const Source& source) {
        nlohmann::json value;
        std::optional<Request<Method>> request;
        std::string decode_error;
        try {
            value = Codec::decode(data, size);
            request.emplace(wire::decode_request<Format, Method>(value));
        } catch (const std::exception& exc) {
            decode_error = exc.what();
        }

        if (request) {
            std::optional<Response<Result>> response = handle_request(std::move(*request), source);
            if (!response) {
                return std::nullopt;
            }
            return detail::pack_response<Codec, Format>(*response);
        }

        LOG4CPLUS_ERROR(server_logger(), "Failed to parse RPC request from " << source << ": " << decode_error);
        return recover<Codec>(value, decode_error, source);
    }

    template <typename Codec>
    std::optional<codec::Bytes> handle_request_payload(const codec::Bytes& payload, const Source& source) {
        return handle_request_payload<Codec>(payload.data(), payload.size(), source);
    }

private:
    RpcResult<Result> invoke(Method method, const Source& source) {
        try {
            return handle(std::move(method), source);
        } catch (const std::exception& exc) {
            LOG4CPLUS_ERROR(server_logger(), "RPC handler failed for " << source << ": " << exc.what());
            return RpcError::make(ErrorKind::InternalError, String(exc.what()));
        }
    }

    // value is null when the payload was not even decodable by the codec.
    template <typename Codec>
    std::optional<codec::Bytes> recover(const nlohmann::json& value, const std::string& decode_error, const Source& source) {
        ProbeRequest probe;
        try {
            probe = Format::probe_request(value);
        } catch (const std::exception& exc) {
            LOG4CPLUS_WARN(server_logger(), "Dropping unidentifiable request from " << source << ": " << exc.what());
            return std::nullopt;
        }
        if (!probe.id) {
            LOG4CPLUS_WARN(server_logger(), "Dropping request without id from " << source);
            return std::nullopt;
        }
        return detail::pack_response<Codec, Format>(
            Response<Result>(std::move(*probe.id), Format::recovery_error(probe, decode_error)));
    }
};

} // namespace jrpc
