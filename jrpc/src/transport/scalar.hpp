#pragma once

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <string_view>

namespace jrpc::transport {

class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Infers a scalar from text: true/false/null, then unsigned, signed and floating numbers, else a string.
nlohmann::json parse_scalar(std::string_view text);

/// Text form of a scalar; strings are returned unquoted.
/// Throws TransportError for arrays, objects and binary values.
std::string scalar_to_string(const std::string& field, const nlohmann::json& value);

} // namespace jrpc::transport
