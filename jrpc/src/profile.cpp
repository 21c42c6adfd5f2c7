#include "profile.hpp"

#include "codec.hpp"

#include <limits>
#include <stdexcept>

namespace jrpc {

#ifdef JRPC_CONSTRAINED

Id make_id(std::uint32_t counter) {
    return counter;
}

nlohmann::json id_to_json(const Id& id) {
    return nlohmann::json(id);
}

Id parse_id(const nlohmann::json& value) {
    if (value.is_number_unsigned() && value.get<std::uint64_t>() <= std::numeric_limits<std::uint32_t>::max()) {
        return static_cast<Id>(value.get<std::uint64_t>());
    }
    if (value.is_number_integer() && value.get<std::int64_t>() >= 0 &&
        value.get<std::int64_t>() <= std::numeric_limits<std::uint32_t>::max()) {
        return static_cast<Id>(value.get<std::int64_t>());
    }
    throw codec::UnpackError("invalid type: expected u32 identifier, got " + std::string(value.type_name()));
}

std::string id_to_string(const Id& id) {
    return std::to_string(id);
}

#else

Id make_id(std::uint32_t counter) {
    return nlohmann::json(counter);
}

nlohmann::json id_to_json(const Id& id) {
    return id;
}

Id parse_id(const nlohmann::json& value) {
    if (value.is_structured() || value.is_binary() || value.is_discarded()) {
        throw codec::UnpackError("invalid type: expected scalar identifier, got " + std::string(value.type_name()));
    }
    return value;
}

std::string id_to_string(const Id& id) {
    if (id.is_string()) {
        return id.get<std::string>();
    }
    if (id.is_structured() || id.is_binary()) {
        throw std::invalid_argument("unsupported identifier type " + std::string(id.type_name()));
    }
    return id.dump();
}

#endif

std::optional<Id> parse_optional_id(const nlohmann::json& value) {
    if (value.is_null()) {
        return std::nullopt;
    }
    return parse_id(value);
}

} // namespace jrpc
