#pragma once

#include "error.hpp"
#include "profile.hpp"

#include <optional>
#include <string>
#include <utility>

namespace jrpc {

/// JSON-RPC request envelope. Without an id it is fire-and-forget and never answered.
template <typename Method>
class Request {
public:
    Request(Id id, Method method) : id_(std::move(id)), method_(std::move(method)) {}

    static Request fire_and_forget(Method method) { return Request(std::move(method)); }

    static Request from_parts(std::optional<Id> id, Method method) {
        Request request(std::move(method));
        request.id_ = std::move(id);
        return request;
    }

    std::pair<std::optional<Id>, Method> into_parts() && { return {std::move(id_), std::move(method_)}; }

    const std::optional<Id>& id() const { return id_; }
    const Method& method() const { return method_; }
    Method& method() { return method_; }

    bool expects_response() const { return id_.has_value(); }

    friend bool operator==(const Request& lhs, const Request& rhs) {
        return lhs.id_ == rhs.id_ && lhs.method_ == rhs.method_;
    }
    friend bool operator!=(const Request& lhs, const Request& rhs) { return !(lhs == rhs); }

private:
    explicit Request(Method method) : method_(std::move(method)) {}

    std::optional<Id> id_;
    Method method_;
};

/// JSON-RPC response envelope: the id of the answered call and its outcome.
template <typename Result>
class Response {
public:
    Response(Id id, Outcome<Result> outcome) : id_(std::move(id)), outcome_(std::move(outcome)) {}

    static Response from_outcome(Id id, Outcome<Result> outcome) { return Response(std::move(id), std::move(outcome)); }

    static Response from_parts(Id id, Outcome<Result> outcome) { return Response(std::move(id), std::move(outcome)); }

    static Response from_internal_error(Id id, String message) {
        return Response(std::move(id), RpcError::make(ErrorKind::InternalError, std::move(message)));
    }

    std::pair<Id, Outcome<Result>> into_parts() && { return {std::move(id_), std::move(outcome_)}; }

    /// Same id, outcome replaced by the error.
    Response into_error_response(RpcError error) && { return Response(std::move(id_), std::move(error)); }

    Response into_internal_error(String message) && {
        return from_internal_error(std::move(id_), std::move(message));
    }

    const Id& id() const { return id_; }
    const Outcome<Result>& outcome() const { return outcome_; }

    friend bool operator==(const Response& lhs, const Response& rhs) {
        return lhs.id_ == rhs.id_ && lhs.outcome_ == rhs.outcome_;
    }
    friend bool operator!=(const Response& lhs, const Response& rhs) { return !(lhs == rhs); }

private:
    Id id_;
    Outcome<Result> outcome_;
};

/// What can still be read from a payload that failed to decode as a request.
struct ProbeRequest {
    std::optional<std::string> jsonrpc;
    std::optional<Id> id;
};

} // namespace jrpc
