#pragma once

#include "profile.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

namespace jrpc {

// Reserved JSON-RPC 2.0 error codes.
constexpr std::int16_t kParseErrorCode = -32700;
constexpr std::int16_t kInvalidRequestCode = -32600;
constexpr std::int16_t kMethodNotFoundCode = -32601;
constexpr std::int16_t kInvalidParamsCode = -32602;
constexpr std::int16_t kInternalErrorCode = -32603;

/**
 * Kind of an RPC error. Five reserved kinds plus Custom, which carries any other code.
 * Conversion to and from the 16-bit wire code is total.
 */
class ErrorKind {
public:
    enum Value : std::uint8_t {
        ParseError,
        InvalidRequest,
        MethodNotFound,
        InvalidParams, // not raised by the protocol layer, reserved for handlers
        InternalError,
        Custom,
    };

    constexpr ErrorKind(Value value) : value_(value) {}

    static constexpr ErrorKind custom(std::int16_t code) { return ErrorKind(Custom, code); }

    /// Reserved codes map to their kind, anything else to Custom(code).
    static ErrorKind from_code(std::int16_t code);

    std::int16_t code() const;
    Value value() const { return value_; }
    bool is_custom() const { return value_ == Custom; }

    std::string to_string() const { return std::to_string(code()); }

    friend bool operator==(ErrorKind lhs, ErrorKind rhs) { return lhs.value_ == rhs.value_ && lhs.custom_code_ == rhs.custom_code_; }
    friend bool operator!=(ErrorKind lhs, ErrorKind rhs) { return !(lhs == rhs); }

private:
    constexpr ErrorKind(Value value, std::int16_t custom_code) : value_(value), custom_code_(custom_code) {}

    Value value_;
    std::int16_t custom_code_ = 0;
};

std::ostream& operator<<(std::ostream& os, ErrorKind kind);

class RpcError {
public:
    RpcError(ErrorKind kind, std::optional<String> message) : kind_(kind), message_(std::move(message)) {}

    static RpcError make(ErrorKind kind) { return RpcError(kind, std::nullopt); }
    static RpcError make(ErrorKind kind, String message) { return RpcError(kind, std::move(message)); }

    ErrorKind kind() const { return kind_; }
    const std::optional<String>& message() const { return message_; }

    /// "message (code)", or just "code" without a message.
    std::string to_string() const;

    friend bool operator==(const RpcError& lhs, const RpcError& rhs) {
        return lhs.kind_ == rhs.kind_ && lhs.message_ == rhs.message_;
    }
    friend bool operator!=(const RpcError& lhs, const RpcError& rhs) { return !(lhs == rhs); }

private:
    ErrorKind kind_;
    std::optional<String> message_;
};

std::ostream& operator<<(std::ostream& os, const RpcError& error);

/// Result of a call: exactly one of a value or an RpcError.
template <typename R>
class Outcome {
public:
    Outcome(R value) : state_(std::in_place_index<0>, std::move(value)) {}
    Outcome(RpcError error) : state_(std::in_place_index<1>, std::move(error)) {}

    static Outcome success(R value) { return Outcome(std::move(value)); }
    static Outcome failure(RpcError error) { return Outcome(std::move(error)); }

    bool is_ok() const { return state_.index() == 0; }
    bool is_err() const { return state_.index() == 1; }

    const R* ok() const { return std::get_if<0>(&state_); }
    const RpcError* err() const { return std::get_if<1>(&state_); }

    /// Throws std::bad_variant_access when the outcome is an error.
    const R& value() const { return std::get<0>(state_); }
    R& value() { return std::get<0>(state_); }
    const RpcError& error() const { return std::get<1>(state_); }

    friend bool operator==(const Outcome& lhs, const Outcome& rhs) { return lhs.state_ == rhs.state_; }
    friend bool operator!=(const Outcome& lhs, const Outcome& rhs) { return !(lhs == rhs); }

private:
    std::variant<R, RpcError> state_;
};

/// What a handler returns and what a client receives.
template <typename R>
using RpcResult = Outcome<R>;

} // namespace jrpc
