#pragma once

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace jrpc {

/**
 * String with inline storage and a fixed capacity.
 * Text longer than N bytes is cut at the last complete UTF-8 sequence that fits.
 */
template <std::size_t N>
class FixedString {
public:
    FixedString() = default;
    FixedString(std::string_view text) { assign(text); }
    FixedString(const char* text) { assign(text ? std::string_view(text) : std::string_view()); }
    FixedString(const std::string& text) { assign(text); }

    void assign(std::string_view text) {
        std::size_t length = std::min(text.size(), N);
        if (length < text.size()) {
            // back off to the start of the sequence that did not fit
            while (length > 0 && (static_cast<unsigned char>(text[length]) & 0xC0) == 0x80) {
                --length;
            }
        }
        std::memcpy(data_.data(), text.data(), length);
        size_ = length;
    }

    /// Appends as much of text as fits; returns false when truncated.
    bool append(std::string_view text) {
        std::size_t room = N - size_;
        std::size_t length = std::min(text.size(), room);
        if (length < text.size()) {
            while (length > 0 && (static_cast<unsigned char>(text[length]) & 0xC0) == 0x80) {
                --length;
            }
        }
        std::memcpy(data_.data() + size_, text.data(), length);
        size_ += length;
        return length == text.size();
    }

    void clear() { size_ = 0; }

    const char* data() const { return data_.data(); }
    std::size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    static constexpr std::size_t capacity() { return N; }

    std::string_view view() const { return std::string_view(data_.data(), size_); }
    operator std::string_view() const { return view(); }
    std::string str() const { return std::string(view()); }

    friend bool operator==(const FixedString& lhs, const FixedString& rhs) { return lhs.view() == rhs.view(); }
    friend bool operator!=(const FixedString& lhs, const FixedString& rhs) { return !(lhs == rhs); }
    friend bool operator==(const FixedString& lhs, std::string_view rhs) { return lhs.view() == rhs; }
    friend bool operator==(std::string_view lhs, const FixedString& rhs) { return lhs == rhs.view(); }
    friend bool operator!=(const FixedString& lhs, std::string_view rhs) { return lhs.view() != rhs; }
    friend bool operator==(const FixedString& lhs, const char* rhs) { return lhs.view() == std::string_view(rhs); }
    friend bool operator!=(const FixedString& lhs, const char* rhs) { return !(lhs == rhs); }

    friend std::ostream& operator<<(std::ostream& os, const FixedString& text) { return os << text.view(); }

private:
    std::array<char, N> data_{};
    std::size_t size_ = 0;
};

template <std::size_t N>
void to_json(nlohmann::json& value, const FixedString<N>& text) {
    value = text.str();
}

template <std::size_t N>
void from_json(const nlohmann::json& value, FixedString<N>& text) {
    text.assign(value.get_ref<const std::string&>());
}

constexpr std::size_t kConstrainedStringCapacity = 128;

#ifdef JRPC_CONSTRAINED
/// Call identifier of the constrained profile.
using Id = std::uint32_t;
using String = FixedString<kConstrainedStringCapacity>;
#else
/// Call identifier: any JSON scalar supplied by the caller.
using Id = nlohmann::json;
using String = std::string;
#endif

/// Identifier for the n-th call issued by a client.
Id make_id(std::uint32_t counter);

nlohmann::json id_to_json(const Id& id);

/// Parses a wire identifier. Throws codec::UnpackError when the value is not a valid identifier.
Id parse_id(const nlohmann::json& value);

/// Parses an optional request identifier; JSON null means absent.
std::optional<Id> parse_optional_id(const nlohmann::json& value);

/// Plain text form: strings unquoted, numbers and literals as written on the wire.
/// Throws std::invalid_argument for non-scalar identifiers.
std::string id_to_string(const Id& id);

} // namespace jrpc
