#include "wire_format.hpp"

#include <limits>

namespace jrpc::wire {

nlohmann::json encode_error(const RpcError& error) {
    nlohmann::json value;
    value["code"] = error.kind().code();
    if (error.message()) {
        value["message"] = *error.message();
    }
    return value;
}

RpcError decode_error(const nlohmann::json& value) {
    if (!value.is_object()) {
        throw codec::UnpackError(std::string("invalid type: ") + value.type_name() + ", expected error object");
    }
    auto code_it = value.find("code");
    if (code_it == value.end()) {
        throw codec::UnpackError("missing field `code`");
    }
    if (!code_it->is_number_integer()) {
        throw codec::UnpackError(std::string("invalid type: ") + code_it->type_name() + ", expected i16 error code");
    }
    if (code_it->is_number_unsigned() && code_it->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int16_t>::max())) {
        throw codec::UnpackError("invalid value: " + code_it->dump() + ", expected i16 error code");
    }
    int64_t code = code_it->get<int64_t>();
    if (code < std::numeric_limits<int16_t>::min() || code > std::numeric_limits<int16_t>::max()) {
        throw codec::UnpackError("invalid value: " + code_it->dump() + ", expected i16 error code");
    }

    std::optional<String> message;
    auto message_it = value.find("message");
    if (message_it != value.end() && !message_it->is_null()) {
        if (!message_it->is_string()) {
            throw codec::UnpackError(std::string("invalid type: ") + message_it->type_name() + ", expected error message");
        }
        message = String(message_it->get_ref<const std::string&>());
    }
    return RpcError(ErrorKind::from_code(static_cast<int16_t>(code)), std::move(message));
}

} // namespace jrpc::wire
