#include "json_codec.hpp"

namespace jrpc::codec {

Bytes Json::encode(const nlohmann::json& value) {
    std::string text;
    try {
        text = value.dump();
    } catch (const nlohmann::json::exception& exc) {
        throw PackError(exc.what());
    }
    return Bytes(text.begin(), text.end());
}

nlohmann::json Json::decode(const std::uint8_t* data, std::size_t size) {
    try {
        // depth counts the containers around the one being opened
        return nlohmann::json::parse(data, data + size,
                                     [](int depth, nlohmann::json::parse_event_t event, nlohmann::json&) {
                                         if ((event == nlohmann::json::parse_event_t::object_start ||
                                              event == nlohmann::json::parse_event_t::array_start) &&
                                             static_cast<std::size_t>(depth) >= kMaxNestingDepth) {
                                             throw UnpackError("recursion limit exceeded");
                                         }
                                         return true;
                                     });
    } catch (const nlohmann::json::exception& exc) {
        throw UnpackError(exc.what());
    }
}

} // namespace jrpc::codec
