#pragma once

#include "codec.hpp"

#include <nlohmann/json.hpp>

namespace jrpc::codec {

/// UTF-8 JSON text.
struct Json : BasicCodec<Json> {
    static constexpr const char* kName = "json";

    static Bytes encode(const nlohmann::json& value);
    static nlohmann::json decode(const std::uint8_t* data, std::size_t size);
};

} // namespace jrpc::codec
