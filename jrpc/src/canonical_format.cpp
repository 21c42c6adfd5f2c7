#include "wire_format.hpp"

namespace jrpc::wire {

namespace {

// Returns the marker when present; a non-"2.0" marker fails the decode.
std::optional<std::string> read_version(const nlohmann::json& value) {
    if (value.is_null()) {
        return std::nullopt;
    }
    if (!value.is_string()) {
        throw codec::UnpackError(std::string("invalid type: ") + value.type_name() + ", expected protocol version string");
    }
    return value.get<std::string>();
}

void validate_version(const nlohmann::json& value) {
    auto version = read_version(value);
    if (version && *version != kProtocolVersion) {
        throw codec::UnpackError(kInvalidProtocolVersion);
    }
}

bool is_id_key(const std::string& key) {
    return key == "id" || key == "i";
}

} // namespace

nlohmann::json Canonical::encode_request(const Request<MethodCall>& request) {
    nlohmann::json value;
    value["jsonrpc"] = kProtocolVersion;
    if (request.id()) {
        value["id"] = id_to_json(*request.id());
    }
    value["method"] = request.method().name;
    if (!request.method().params.is_null()) {
        value["params"] = request.method().params;
    }
    return value;
}

Request<MethodCall> Canonical::decode_request(const nlohmann::json& value) {
    if (!value.is_object()) {
        throw codec::UnpackError(std::string("invalid type: ") + value.type_name() + ", expected request object");
    }

    const nlohmann::json* id = nullptr;
    const nlohmann::json* method = nullptr;
    nlohmann::json params;
    for (auto it = value.begin(); it != value.end(); ++it) {
        const std::string& key = it.key();
        if (key == "jsonrpc") {
            validate_version(it.value());
        } else if (is_id_key(key)) {
            if (id) {
                throw codec::UnpackError("duplicate field `id`");
            }
            id = &it.value();
        } else if (key == "method") {
            method = &it.value();
        } else if (key == "params") {
            params = it.value();
        } else {
            throw codec::UnpackError("unknown field `" + key + "`, expected one of `jsonrpc`, `id`, `method`, `params`");
        }
    }

    if (!method) {
        throw codec::UnpackError("missing field `method`");
    }
    if (!method->is_string()) {
        throw codec::UnpackError(std::string("invalid type: ") + method->type_name() + ", expected method name");
    }

    std::optional<Id> request_id;
    if (id) {
        request_id = parse_optional_id(*id);
    }
    return Request<MethodCall>::from_parts(std::move(request_id), MethodCall{method->get<std::string>(), std::move(params)});
}

nlohmann::json Canonical::encode_response(const Response<nlohmann::json>& response) {
    nlohmann::json value = encode_outcome(response.outcome());
    value["jsonrpc"] = kProtocolVersion;
    value["id"] = id_to_json(response.id());
    return value;
}

Response<nlohmann::json> Canonical::decode_response(const nlohmann::json& value) {
    if (!value.is_object()) {
        throw codec::UnpackError(std::string("invalid type: ") + value.type_name() + ", expected response object");
    }

    const nlohmann::json* id = nullptr;
    const nlohmann::json* result = nullptr;
    const nlohmann::json* error = nullptr;
    for (auto it = value.begin(); it != value.end(); ++it) {
        const std::string& key = it.key();
        if (key == "jsonrpc") {
            validate_version(it.value());
        } else if (is_id_key(key)) {
            if (id) {
                throw codec::UnpackError("duplicate field `id`");
            }
            id = &it.value();
        } else if (key == "result" || key == "r") {
            if (result) {
                throw codec::UnpackError("duplicate field `result`");
            }
            result = &it.value();
        } else if (key == "error" || key == "e") {
            if (error) {
                throw codec::UnpackError("duplicate field `error`");
            }
            error = &it.value();
        } else {
            throw codec::UnpackError("unknown field `" + key + "`, expected one of `jsonrpc`, `id`, `result`, `error`");
        }
    }

    if (!id) {
        throw codec::UnpackError("missing field `id`");
    }
    if (result && error) {
        throw codec::UnpackError("invalid response: both `result` and `error` present");
    }
    if (result) {
        return Response<nlohmann::json>(parse_id(*id), Outcome<nlohmann::json>(*result));
    }
    if (error) {
        return Response<nlohmann::json>(parse_id(*id), decode_error(*error));
    }
    throw codec::UnpackError("invalid response: expected `result` or `error`");
}

nlohmann::json Canonical::encode_outcome(const Outcome<nlohmann::json>& outcome) {
    nlohmann::json value = nlohmann::json::object();
    if (const nlohmann::json* result = outcome.ok()) {
        value["result"] = *result;
    } else {
        value["error"] = encode_error(outcome.error());
    }
    return value;
}

ProbeRequest Canonical::probe_request(const nlohmann::json& value) {
    if (!value.is_object()) {
        throw codec::UnpackError(std::string("invalid type: ") + value.type_name() + ", expected request object");
    }

    ProbeRequest probe;
    auto version_it = value.find("jsonrpc");
    if (version_it != value.end()) {
        probe.jsonrpc = read_version(*version_it);
    }
    auto id_it = value.find("id");
    if (id_it == value.end()) {
        id_it = value.find("i");
    }
    if (id_it != value.end()) {
        probe.id = parse_optional_id(*id_it);
    }
    return probe;
}

RpcError Canonical::recovery_error(const ProbeRequest& probe, const std::string& decode_error) {
    if (!probe.jsonrpc) {
        return RpcError::make(ErrorKind::InvalidRequest);
    }
    if (*probe.jsonrpc == kProtocolVersion) {
        return RpcError::make(ErrorKind::MethodNotFound, String(decode_error));
    }
    return RpcError::make(ErrorKind::InvalidRequest, String(kInvalidProtocolVersion));
}

} // namespace jrpc::wire
