#pragma once

#include "codec.hpp"

#include <msgpack.hpp>
#include <nlohmann/json.hpp>

#include <string>

namespace jrpc::codec {

/// MessagePack with string-keyed maps.
struct Msgpack : BasicCodec<Msgpack> {
    static constexpr const char* kName = "msgpack";

    static Bytes encode(const nlohmann::json& value);
    static nlohmann::json decode(const std::uint8_t* data, std::size_t size);
};

void pack_value(msgpack::packer<msgpack::sbuffer>& pk, const nlohmann::json& value);

/// Structural copy of an unpacked object. Maps need string keys; nesting is capped at kMaxNestingDepth.
nlohmann::json object_to_json(const msgpack::object& obj);

} // namespace jrpc::codec
