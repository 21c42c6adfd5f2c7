#pragma once

#include "codec.hpp"
#include "error.hpp"
#include "logger.hpp"
#include "protocol.hpp"
#include "wire_format.hpp"

#include <log4cplus/loggingmacros.h>

#include <atomic>
#include <cstdint>
#include <optional>
#include <utility>

namespace jrpc {

constexpr const char* kNoRequestId = "no identifier";
constexpr const char* kResponseIdMismatch = "response id does not match request id";

/// One issued call: the encoded request and the means to resolve its response.
template <typename Codec, typename Result, typename Format = wire::DefaultFormat>
class PendingCall {
public:
    PendingCall(std::optional<std::uint32_t> id, codec::Bytes payload) : id_(id), payload_(std::move(payload)) {}

    const std::optional<std::uint32_t>& id() const { return id_; }

    const codec::Bytes& payload() const { return payload_; }

    /// Moves the payload out, leaving this call with an empty one.
    codec::Bytes take_payload() { return std::exchange(payload_, codec::Bytes()); }

    RpcResult<Result> handle_response(const std::uint8_t* data, std::size_t size) const {
        if (!id_) {
            return RpcError::make(ErrorKind::InvalidRequest, String(kNoRequestId));
        }

        std::optional<Response<Result>> response;
        try {
            response.emplace(wire::decode_response<Format, Result>(Codec::decode(data, size)));
        } catch (const codec::CodecError& exc) {
            LOG4CPLUS_WARN(client_logger(), "Undecodable response for call " << *id_ << ": " << exc.what());
            return RpcError::make(ErrorKind::ParseError, String(exc.what()));
        }

        if (!(response->id() == make_id(*id_))) {
            LOG4CPLUS_WARN(client_logger(), "Response id mismatch for call " << *id_);
            return RpcError::make(ErrorKind::InvalidRequest, String(kResponseIdMismatch));
        }
        return std::move(*response).into_parts().second;
    }

    RpcResult<Result> handle_response(const codec::Bytes& payload) const {
        return handle_response(payload.data(), payload.size());
    }

private:
    std::optional<std::uint32_t> id_;
    codec::Bytes payload_;
};

/**
 * Client side of the protocol: numbers calls and encodes their requests.
 * Codec, method and result types are bound at compile time; the only state is
 * the call counter, which starts at zero and wraps around.
 */
template <typename Codec, typename Method, typename Result, typename Format = wire::DefaultFormat>
class RpcClient {
public:
    using Call = PendingCall<Codec, Result, Format>;

    RpcClient() = default;
    RpcClient(const RpcClient&) = delete;
    RpcClient& operator=(const RpcClient&) = delete;

    /// Throws codec::PackError when the request cannot be encoded.
    Call request(Method method) {
        std::uint32_t id = next_id_.fetch_add(1, std::memory_order_relaxed);
        LOG4CPLUS_DEBUG(client_logger(), "Encoding call " << id);
        codec::Bytes payload = Codec::encode(wire::encode_request<Format>(Request<Method>(make_id(id), std::move(method))));
        return Call(id, std::move(payload));
    }

    /// Request without an id; the callee never answers it.
    Call request_fire_and_forget(Method method) {
        codec::Bytes payload = Codec::encode(wire::encode_request<Format>(Request<Method>::fire_and_forget(std::move(method))));
        return Call(std::nullopt, std::move(payload));
    }

private:
    std::atomic<std::uint32_t> next_id_{0};
};

} // namespace jrpc
