#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace jrpc::codec {

using Bytes = std::vector<std::uint8_t>;

/// Deepest array/object nesting a decoder accepts.
constexpr std::size_t kMaxNestingDepth = 128;

class CodecError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class PackError : public CodecError {
public:
    using CodecError::CodecError;
};

class UnpackError : public CodecError {
public:
    using CodecError::CodecError;
};

/// Structural form of any value nlohmann::json knows how to convert.
template <typename T>
nlohmann::json to_value(const T& value) {
    try {
        return nlohmann::json(value);
    } catch (const nlohmann::json::exception& exc) {
        throw PackError(exc.what());
    }
}

template <typename T>
T from_value(const nlohmann::json& value) {
    try {
        return value.get<T>();
    } catch (const nlohmann::json::exception& exc) {
        throw UnpackError(exc.what());
    }
}

/**
 * Byte codec: turns structural values into bytes and back.
 *
 * Derived codecs provide
 *   static Bytes encode(const nlohmann::json& value);                    // throws PackError
 *   static nlohmann::json decode(const std::uint8_t* data, std::size_t size);  // throws UnpackError
 */
template <typename Derived>
struct BasicCodec {
    template <typename T>
    static Bytes pack(const T& value) {
        return Derived::encode(to_value(value));
    }

    template <typename T>
    static T unpack(const std::uint8_t* data, std::size_t size) {
        return from_value<T>(Derived::decode(data, size));
    }

    template <typename T>
    static T unpack(const Bytes& bytes) {
        return unpack<T>(bytes.data(), bytes.size());
    }
};

} // namespace jrpc::codec
