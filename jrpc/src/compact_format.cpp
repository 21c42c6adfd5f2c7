#include "wire_format.hpp"

namespace jrpc::wire {

namespace {

// The marker carries no meaning here, but a present one must still be a string.
std::optional<std::string> read_marker(const nlohmann::json& value) {
    if (value.is_null()) {
        return std::nullopt;
    }
    if (!value.is_string()) {
        throw codec::UnpackError(std::string("invalid type: ") + value.type_name() + ", expected protocol version string");
    }
    return value.get<std::string>();
}

const nlohmann::json* find_id(const nlohmann::json& value) {
    auto it = value.find("i");
    if (it == value.end()) {
        it = value.find("id");
    }
    return it == value.end() ? nullptr : &*it;
}

} // namespace

nlohmann::json Compact::encode_request(const Request<MethodCall>& request) {
    nlohmann::json value;
    if (request.id()) {
        value["i"] = id_to_json(*request.id());
    }
    value["m"] = request.method().name;
    if (!request.method().params.is_null()) {
        value["p"] = request.method().params;
    }
    return value;
}

Request<MethodCall> Compact::decode_request(const nlohmann::json& value) {
    if (!value.is_object()) {
        throw codec::UnpackError(std::string("invalid type: ") + value.type_name() + ", expected request object");
    }

    for (auto it = value.begin(); it != value.end(); ++it) {
        const std::string& key = it.key();
        if (key != "i" && key != "id" && key != "m" && key != "p" && key != "jsonrpc") {
            throw codec::UnpackError("unknown field `" + key + "`, expected one of `i`, `m`, `p`");
        }
    }
    if (value.contains("i") && value.contains("id")) {
        throw codec::UnpackError("duplicate field `i`");
    }
    if (auto marker = value.find("jsonrpc"); marker != value.end()) {
        read_marker(*marker);
    }

    auto method = value.find("m");
    if (method == value.end()) {
        throw codec::UnpackError("missing field `m`");
    }
    if (!method->is_string()) {
        throw codec::UnpackError(std::string("invalid type: ") + method->type_name() + ", expected method name");
    }

    std::optional<Id> request_id;
    if (const nlohmann::json* id = find_id(value)) {
        request_id = parse_optional_id(*id);
    }
    auto params = value.find("p");
    return Request<MethodCall>::from_parts(
        std::move(request_id),
        MethodCall{method->get<std::string>(), params == value.end() ? nlohmann::json() : *params});
}

nlohmann::json Compact::encode_response(const Response<nlohmann::json>& response) {
    nlohmann::json value = encode_outcome(response.outcome());
    value["i"] = id_to_json(response.id());
    return value;
}

Response<nlohmann::json> Compact::decode_response(const nlohmann::json& value) {
    if (!value.is_object()) {
        throw codec::UnpackError(std::string("invalid type: ") + value.type_name() + ", expected response object");
    }

    for (auto it = value.begin(); it != value.end(); ++it) {
        const std::string& key = it.key();
        if (key != "i" && key != "id" && key != "r" && key != "e" && key != "jsonrpc") {
            throw codec::UnpackError("unknown field `" + key + "`, expected one of `i`, `r`, `e`");
        }
    }
    if (value.contains("i") && value.contains("id")) {
        throw codec::UnpackError("duplicate field `i`");
    }
    if (auto marker = value.find("jsonrpc"); marker != value.end()) {
        read_marker(*marker);
    }

    const nlohmann::json* id = find_id(value);
    if (!id) {
        throw codec::UnpackError("missing field `i`");
    }
    auto result = value.find("r");
    auto error = value.find("e");
    if (result != value.end() && error != value.end()) {
        throw codec::UnpackError("invalid response: both `r` and `e` present");
    }
    if (result != value.end()) {
        return Response<nlohmann::json>(parse_id(*id), Outcome<nlohmann::json>(*result));
    }
    if (error != value.end()) {
        return Response<nlohmann::json>(parse_id(*id), decode_error(*error));
    }
    throw codec::UnpackError("invalid response: expected `r` or `e`");
}

nlohmann::json Compact::encode_outcome(const Outcome<nlohmann::json>& outcome) {
    nlohmann::json value = nlohmann::json::object();
    if (const nlohmann::json* result = outcome.ok()) {
        value["r"] = *result;
    } else {
        value["e"] = encode_error(outcome.error());
    }
    return value;
}

ProbeRequest Compact::probe_request(const nlohmann::json& value) {
    if (!value.is_object()) {
        throw codec::UnpackError(std::string("invalid type: ") + value.type_name() + ", expected request object");
    }

    ProbeRequest probe;
    if (auto marker = value.find("jsonrpc"); marker != value.end()) {
        probe.jsonrpc = read_marker(*marker);
    }
    if (const nlohmann::json* id = find_id(value)) {
        probe.id = parse_optional_id(*id);
    }
    return probe;
}

RpcError Compact::recovery_error(const ProbeRequest&, const std::string& decode_error) {
    return RpcError::make(ErrorKind::MethodNotFound, String(decode_error));
}

} // namespace jrpc::wire
