#include "msgpack_codec.hpp"

namespace jrpc::codec {

namespace {

nlohmann::json convert(const msgpack::object& obj, std::size_t depth);

nlohmann::json convert_container(const msgpack::object& obj, std::size_t depth) {
    if (depth >= kMaxNestingDepth) {
        throw UnpackError("recursion limit exceeded");
    }
    if (obj.type == msgpack::type::ARRAY) {
        nlohmann::json array = nlohmann::json::array();
        for (uint32_t i = 0; i < obj.via.array.size; ++i) {
            array.push_back(convert(obj.via.array.ptr[i], depth + 1));
        }
        return array;
    }
    nlohmann::json map = nlohmann::json::object();
    for (uint32_t i = 0; i < obj.via.map.size; ++i) {
        const auto& entry = obj.via.map.ptr[i];
        if (entry.key.type != msgpack::type::STR) {
            throw UnpackError("invalid type: map key is not a string");
        }
        map[std::string(entry.key.via.str.ptr, entry.key.via.str.size)] = convert(entry.val, depth + 1);
    }
    return map;
}

nlohmann::json convert(const msgpack::object& obj, std::size_t depth) {
    switch (obj.type) {
        case msgpack::type::NIL:
            return nullptr;
        case msgpack::type::BOOLEAN:
            return obj.via.boolean;
        case msgpack::type::POSITIVE_INTEGER:
            return obj.via.u64;
        case msgpack::type::NEGATIVE_INTEGER:
            return obj.via.i64;
        case msgpack::type::FLOAT32:
        case msgpack::type::FLOAT64:
            return obj.via.f64;
        case msgpack::type::STR:
            return std::string(obj.via.str.ptr, obj.via.str.size);
        case msgpack::type::BIN: {
            auto* begin = reinterpret_cast<const std::uint8_t*>(obj.via.bin.ptr);
            return nlohmann::json::binary(std::vector<std::uint8_t>(begin, begin + obj.via.bin.size));
        }
        case msgpack::type::ARRAY:
        case msgpack::type::MAP:
            return convert_container(obj, depth);
        default:
            break;
    }
    throw UnpackError("unsupported msgpack type " + std::to_string(static_cast<int>(obj.type)));
}

} // namespace

Bytes Msgpack::encode(const nlohmann::json& value) {
    msgpack::sbuffer buffer;
    msgpack::packer<msgpack::sbuffer> pk(&buffer);
    pack_value(pk, value);
    auto* begin = reinterpret_cast<const std::uint8_t*>(buffer.data());
    return Bytes(begin, begin + buffer.size());
}

nlohmann::json Msgpack::decode(const std::uint8_t* data, std::size_t size) {
    msgpack::object_handle handle;
    std::size_t offset = 0;
    try {
        msgpack::unpack_limit limit(0xffffffff, 0xffffffff, 0xffffffff, 0xffffffff, 0xffffffff, kMaxNestingDepth);
        handle = msgpack::unpack(reinterpret_cast<const char*>(data), size, offset, nullptr, nullptr, limit);
    } catch (const std::exception& exc) {
        throw UnpackError(exc.what());
    }
    if (offset != size) {
        throw UnpackError("trailing bytes after msgpack value");
    }
    return object_to_json(handle.get());
}

void pack_value(msgpack::packer<msgpack::sbuffer>& pk, const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::null:
            pk.pack_nil();
            break;
        case nlohmann::json::value_t::boolean:
            pk.pack(value.get<bool>());
            break;
        case nlohmann::json::value_t::number_integer:
            pk.pack(value.get<int64_t>());
            break;
        case nlohmann::json::value_t::number_unsigned:
            pk.pack(value.get<uint64_t>());
            break;
        case nlohmann::json::value_t::number_float:
            pk.pack(value.get<double>());
            break;
        case nlohmann::json::value_t::string:
            pk.pack(value.get_ref<const std::string&>());
            break;
        case nlohmann::json::value_t::binary: {
            const auto& bin = value.get_binary();
            pk.pack_bin(static_cast<uint32_t>(bin.size()));
            pk.pack_bin_body(reinterpret_cast<const char*>(bin.data()), static_cast<uint32_t>(bin.size()));
            break;
        }
        case nlohmann::json::value_t::array:
            pk.pack_array(static_cast<uint32_t>(value.size()));
            for (const auto& item : value) {
                pack_value(pk, item);
            }
            break;
        case nlohmann::json::value_t::object:
            pk.pack_map(static_cast<uint32_t>(value.size()));
            for (auto it = value.begin(); it != value.end(); ++it) {
                pk.pack(it.key());
                pack_value(pk, it.value());
            }
            break;
        case nlohmann::json::value_t::discarded:
            throw PackError("cannot pack a discarded value");
    }
}

nlohmann::json object_to_json(const msgpack::object& obj) {
    return convert(obj, 0);
}

} // namespace jrpc::codec
