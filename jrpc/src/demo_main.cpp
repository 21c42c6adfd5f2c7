#include "client.hpp"
#include "demo/demo_rpc.hpp"
#include "json_codec.hpp"
#include "logger.hpp"
#include "msgpack_codec.hpp"
#include "transport/http_response.hpp"
#include "transport/query_string.hpp"

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <cstring>
#include <iostream>
#include <string>
#include <type_traits>

#ifndef JRPC_VERSION_STRING
#define JRPC_VERSION_STRING "0.0.0"
#endif
#ifndef JRPC_GIT_VERSION_STRING
#define JRPC_GIT_VERSION_STRING "unknown"
#endif
#ifndef JRPC_BUILD_TIMESTAMP
#define JRPC_BUILD_TIMESTAMP "unknown"
#endif

namespace {

using jrpc::demo::DemoMethod;
using jrpc::demo::DemoResult;

template <typename Codec>
std::string describe(const jrpc::codec::Bytes& payload) {
    try {
        return Codec::decode(payload.data(), payload.size()).dump();
    } catch (const std::exception& exc) {
        return std::string("<") + exc.what() + ">";
    }
}

void print_result(const jrpc::RpcResult<DemoResult>& result) {
    if (const DemoResult* value = result.ok()) {
        nlohmann::json json = *value;
        std::cout << "  result: " << json.dump() << std::endl;
    } else {
        std::cout << "  error: " << result.error() << std::endl;
    }
}

template <typename Codec>
void call(jrpc::RpcClient<Codec, DemoMethod, DemoResult>& client, jrpc::demo::DemoRpc<>& server, DemoMethod method) {
    auto request = client.request(std::move(method));
    std::cout << "request payload: " << describe<Codec>(request.payload()) << std::endl;
    auto response = server.template handle_request_payload<Codec>(request.payload(), "local");
    if (!response) {
        std::cout << "  no response" << std::endl;
        return;
    }
    std::cout << "response: " << describe<Codec>(*response) << std::endl;
    print_result(request.handle_response(*response));
}

template <typename Codec>
int run_demo() {
    jrpc::RpcClient<Codec, DemoMethod, DemoResult> client;
    jrpc::demo::DemoRpc<> server;

    call(client, server, DemoMethod::test());
    call(client, server, DemoMethod::hello("world"));
    call(client, server, DemoMethod::complicated());

    auto notification = client.request_fire_and_forget(DemoMethod::list("items"));
    auto silent = server.template handle_request_payload<Codec>(notification.payload(), "local");
    std::cout << "fire-and-forget answered: " << (silent ? "yes" : "no") << std::endl;

    nlohmann::json invalid_params = {{"id", 3}, {"i", 3}, {"method", "test"}, {"params", {{"abc", 123}}}};
    invalid_params.erase(std::is_same_v<jrpc::wire::DefaultFormat, jrpc::wire::Canonical> ? "i" : "id");
    if (std::is_same_v<jrpc::wire::DefaultFormat, jrpc::wire::Canonical>) {
        invalid_params["jsonrpc"] = jrpc::wire::kProtocolVersion;
    } else {
        invalid_params["m"] = invalid_params["method"];
        invalid_params["p"] = invalid_params["params"];
        invalid_params.erase("method");
        invalid_params.erase("params");
    }
    jrpc::codec::Bytes raw = Codec::encode(invalid_params);
    std::cout << "request payload: " << invalid_params.dump() << std::endl;
    if (auto response = server.template handle_request_payload<Codec>(raw, "local")) {
        std::cout << "response: " << describe<Codec>(*response) << std::endl;
    }

    auto query = jrpc::transport::to_query_string(
        jrpc::Request<jrpc::MethodCall>(jrpc::make_id(1), jrpc::MethodCall{"hello", {{"name", "world"}}}));
    std::cout << "query string: " << query << std::endl;
    auto decoded = jrpc::transport::request_from_query_string<DemoMethod>(query);
    if (auto response = server.handle_request(std::move(decoded), "query")) {
        auto http = jrpc::transport::to_http_response(*response);
        std::cout << "http status: " << http.status() << ", " << jrpc::transport::kIdHeader << ": "
                  << http.headers().at(jrpc::transport::kIdHeader) << ", body: " << http.body() << std::endl;
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    std::string config_path = "log4cplus.ini";
    std::string format = jrpc::codec::Json::kName;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "Version: " << JRPC_VERSION_STRING << std::endl;
            std::cout << "Commit: " << JRPC_GIT_VERSION_STRING << std::endl;
            std::cout << "Build Time: " << JRPC_BUILD_TIMESTAMP << std::endl;
            return 0;
        }

        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
            continue;
        }

        if (strncmp(argv[i], "--config=", 9) == 0) {
            config_path = argv[i] + 9;
            continue;
        }

        if (strcmp(argv[i], "--format") == 0 && i + 1 < argc) {
            format = argv[++i];
            continue;
        }

        if (strncmp(argv[i], "--format=", 9) == 0) {
            format = argv[i] + 9;
            continue;
        }

        std::cerr << "Unknown argument: " << argv[i] << std::endl;
        return 2;
    }

    init_logging(config_path);

    LOG4CPLUS_INFO(core_logger(), "jrpc demo starting");
    LOG4CPLUS_INFO(core_logger(), "Version: " << JRPC_VERSION_STRING << ", Commit: " << JRPC_GIT_VERSION_STRING);
    LOG4CPLUS_INFO(core_logger(), "Wire format: " << jrpc::wire::DefaultFormat::kName << ", codec: " << format);

    try {
        if (format == jrpc::codec::Json::kName) {
            return run_demo<jrpc::codec::Json>();
        }
        if (format == jrpc::codec::Msgpack::kName) {
            return run_demo<jrpc::codec::Msgpack>();
        }
    } catch (const std::exception& exc) {
        LOG4CPLUS_ERROR(core_logger(), "Demo failed: " << exc.what());
        return 1;
    }

    LOG4CPLUS_ERROR(core_logger(), "Unknown format: " << format);
    return 2;
}
