#include "method.hpp"

namespace jrpc {

void MethodCall::expect_fields(std::initializer_list<const char*> allowed) const {
    if (params.is_null() && allowed.size() == 0) {
        return;
    }
    if (!params.is_object()) {
        throw codec::UnpackError("invalid type: expected params object for `" + name + "`");
    }
    for (auto it = params.begin(); it != params.end(); ++it) {
        bool known = false;
        for (const char* field : allowed) {
            if (it.key() == field) {
                known = true;
                break;
            }
        }
        if (!known) {
            throw codec::UnpackError("unknown field `" + it.key() + "`");
        }
    }
}

void throw_unknown_method(const MethodCall& call) {
    throw codec::UnpackError("unknown variant `" + call.name + "`");
}

} // namespace jrpc
