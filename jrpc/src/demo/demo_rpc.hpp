#pragma once

#include "../error.hpp"
#include "../method.hpp"
#include "../server.hpp"
#include "../wire_format.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <variant>

namespace jrpc::demo {

class DemoMethod {
public:
    enum class Kind {
        Test,
        Hello,
        List,
        Complicated,
    };

    static DemoMethod test() { return DemoMethod(Kind::Test, ""); }
    static DemoMethod hello(std::string name) { return DemoMethod(Kind::Hello, std::move(name)); }
    static DemoMethod list(std::string i) { return DemoMethod(Kind::List, std::move(i)); }
    static DemoMethod complicated() { return DemoMethod(Kind::Complicated, ""); }

    Kind kind() const { return kind_; }
    const std::string& argument() const { return argument_; }

    MethodCall to_call() const;
    static DemoMethod from_call(const MethodCall& call);

    friend bool operator==(const DemoMethod& lhs, const DemoMethod& rhs) {
        return lhs.kind_ == rhs.kind_ && lhs.argument_ == rhs.argument_;
    }

private:
    DemoMethod(Kind kind, std::string argument) : kind_(kind), argument_(std::move(argument)) {}

    Kind kind_;
    std::string argument_;
};

/// Either {"ok": bool} or a plain string.
class DemoResult {
public:
    DemoResult() = default;

    static DemoResult general(bool ok) { return DemoResult(ok); }
    static DemoResult from_text(std::string text) { return DemoResult(std::move(text)); }

    bool is_general() const { return std::holds_alternative<bool>(value_); }
    bool ok() const { return std::get<bool>(value_); }
    const std::string& text() const { return std::get<std::string>(value_); }

    friend bool operator==(const DemoResult& lhs, const DemoResult& rhs) { return lhs.value_ == rhs.value_; }

private:
    explicit DemoResult(bool ok) : value_(ok) {}
    explicit DemoResult(std::string text) : value_(std::move(text)) {}

    std::variant<bool, std::string> value_{false};
};

void to_json(nlohmann::json& value, const DemoResult& result);
void from_json(const nlohmann::json& value, DemoResult& result);

RpcResult<DemoResult> run_demo_method(const DemoMethod& method, const std::string& source);

template <typename Format = wire::DefaultFormat>
class DemoRpc final : public RpcServer<DemoMethod, DemoResult, std::string, Format> {
public:
    RpcResult<DemoResult> handle(DemoMethod method, const std::string& source) override {
        return run_demo_method(method, source);
    }
};

} // namespace jrpc::demo
