#include "demo_rpc.hpp"

#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace jrpc::demo {

MethodCall DemoMethod::to_call() const {
    switch (kind_) {
        case Kind::Test:
            return MethodCall{"test", nlohmann::json::object()};
        case Kind::Hello:
            return MethodCall{"hello", {{"name", argument_}}};
        case Kind::List:
            return MethodCall{"list", {{"i", argument_}}};
        case Kind::Complicated:
            return MethodCall{"complicated", nlohmann::json::object()};
    }
    return MethodCall{"test", nlohmann::json::object()};
}

DemoMethod DemoMethod::from_call(const MethodCall& call) {
    if (call.name == "test") {
        call.expect_fields({});
        return test();
    }
    if (call.name == "hello") {
        call.expect_fields({"name"});
        return hello(call.param<std::string>("name"));
    }
    if (call.name == "list") {
        call.expect_fields({"i"});
        return list(call.param<std::string>("i"));
    }
    if (call.name == "complicated") {
        call.expect_fields({});
        return complicated();
    }
    throw_unknown_method(call);
}

void to_json(nlohmann::json& value, const DemoResult& result) {
    if (result.is_general()) {
        value = {{"ok", result.ok()}};
    } else {
        value = result.text();
    }
}

void from_json(const nlohmann::json& value, DemoResult& result) {
    if (value.is_string()) {
        result = DemoResult::from_text(value.get<std::string>());
        return;
    }
    if (value.is_object() && value.size() == 1 && value.contains("ok") && value.at("ok").is_boolean()) {
        result = DemoResult::general(value.at("ok").get<bool>());
        return;
    }
    throw codec::UnpackError("data did not match any variant of DemoResult");
}

RpcResult<DemoResult> run_demo_method(const DemoMethod& method, const std::string& source) {
    LOG4CPLUS_DEBUG(core_logger(), "demo call from " << source);
    switch (method.kind()) {
        case DemoMethod::Kind::Test:
            return DemoResult::general(true);
        case DemoMethod::Kind::Hello:
            return DemoResult::from_text("Hello, " + method.argument());
        case DemoMethod::Kind::List:
            return DemoResult::from_text("List, " + method.argument());
        case DemoMethod::Kind::Complicated:
            break;
    }
    return RpcError::make(ErrorKind::custom(-32000), String("Complicated method not implemented"));
}

} // namespace jrpc::demo
