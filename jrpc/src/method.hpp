#pragma once

#include "codec.hpp"

#include <nlohmann/json.hpp>

#include <initializer_list>
#include <string>

namespace jrpc {

/**
 * A method as it travels on the wire: the variant tag and its structured parameters.
 *
 * Application method types bind to it with
 *   MethodCall to_call() const;
 *   static Method from_call(const MethodCall& call);   // throws codec::UnpackError
 * MethodCall satisfies the same contract, so it can be used directly for untyped methods.
 */
struct MethodCall {
    std::string name;
    nlohmann::json params; // null when the method carries no parameters

    MethodCall to_call() const { return *this; }
    static MethodCall from_call(const MethodCall& call) { return call; }

    /// Throws codec::UnpackError unless params is an object with no members outside allowed.
    void expect_fields(std::initializer_list<const char*> allowed) const;

    /// Typed parameter lookup. Throws codec::UnpackError when missing or of the wrong type.
    template <typename T>
    T param(const std::string& key) const {
        if (!params.is_object() || !params.contains(key)) {
            throw codec::UnpackError("missing field `" + key + "`");
        }
        try {
            return params.at(key).get<T>();
        } catch (const nlohmann::json::exception& exc) {
            throw codec::UnpackError("invalid field `" + key + "`: " + exc.what());
        }
    }

    friend bool operator==(const MethodCall& lhs, const MethodCall& rhs) {
        return lhs.name == rhs.name && lhs.params == rhs.params;
    }
    friend bool operator!=(const MethodCall& lhs, const MethodCall& rhs) { return !(lhs == rhs); }
};

/// Thrown from from_call implementations for a tag the application does not know.
[[noreturn]] void throw_unknown_method(const MethodCall& call);

} // namespace jrpc
