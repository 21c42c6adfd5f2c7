#include "error.hpp"

namespace jrpc {

ErrorKind ErrorKind::from_code(std::int16_t code) {
    switch (code) {
        case kParseErrorCode:
            return ParseError;
        case kInvalidRequestCode:
            return InvalidRequest;
        case kMethodNotFoundCode:
            return MethodNotFound;
        case kInvalidParamsCode:
            return InvalidParams;
        case kInternalErrorCode:
            return InternalError;
        default:
            return custom(code);
    }
}

std::int16_t ErrorKind::code() const {
    switch (value_) {
        case ParseError:
            return kParseErrorCode;
        case InvalidRequest:
            return kInvalidRequestCode;
        case MethodNotFound:
            return kMethodNotFoundCode;
        case InvalidParams:
            return kInvalidParamsCode;
        case InternalError:
            return kInternalErrorCode;
        case Custom:
            break;
    }
    return custom_code_;
}

std::ostream& operator<<(std::ostream& os, ErrorKind kind) {
    return os << kind.code();
}

std::string RpcError::to_string() const {
    if (message_) {
        return std::string(std::string_view(*message_)) + " (" + kind_.to_string() + ")";
    }
    return kind_.to_string();
}

std::ostream& operator<<(std::ostream& os, const RpcError& error) {
    return os << error.to_string();
}

} // namespace jrpc
