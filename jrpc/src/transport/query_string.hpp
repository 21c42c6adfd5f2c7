#pragma once

#include "scalar.hpp"

#include "../codec.hpp"
#include "../method.hpp"
#include "../protocol.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace jrpc::transport {

constexpr const char* kQueryIdKey = "i";
constexpr const char* kQueryMethodKey = "m";

/**
 * Request as an urlencoded query string: i=<id>&m=<method>&<param>=<value>...
 * The id is written first as JSON text and is recognised only in first position.
 * Parameter values are scalars; decoding infers their types from the text.
 */
class QueryString {
public:
    explicit QueryString(std::string text) : text_(std::move(text)) {}

    const std::string& str() const { return text_; }

    friend std::ostream& operator<<(std::ostream& os, const QueryString& query) { return os << query.text_; }

private:
    std::string text_;
};

/// Throws TransportError for non-scalar parameters.
QueryString to_query_string(const Request<MethodCall>& request);

/// Throws TransportError when the method is missing or the id is not valid JSON.
Request<MethodCall> from_query_string(const QueryString& query);

template <typename Method>
QueryString request_to_query_string(const Request<Method>& request) {
    return to_query_string(Request<MethodCall>::from_parts(request.id(), request.method().to_call()));
}

template <typename Method>
Request<Method> request_from_query_string(const QueryString& query) {
    auto [id, call] = from_query_string(query).into_parts();
    try {
        return Request<Method>::from_parts(std::move(id), Method::from_call(call));
    } catch (const codec::CodecError& exc) {
        throw TransportError(std::string("pack error: ") + exc.what());
    }
}

std::string form_encode(std::string_view text);
std::string form_decode(std::string_view text);

} // namespace jrpc::transport
