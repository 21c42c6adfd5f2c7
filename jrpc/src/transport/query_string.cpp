#include "query_string.hpp"

#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <vector>

namespace jrpc::transport {

namespace {

constexpr char kHexDigits[] = "0123456789ABCDEF";

int hex_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

void append_pair(std::string& out, std::string_view name, std::string_view value) {
    if (!out.empty()) {
        out += '&';
    }
    out += form_encode(name);
    out += '=';
    out += form_encode(value);
}

std::vector<std::pair<std::string, std::string>> split_pairs(const std::string& text) {
    std::vector<std::pair<std::string, std::string>> pairs;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('&', start);
        if (end == std::string::npos) {
            end = text.size();
        }
        std::string_view segment(text.data() + start, end - start);
        if (!segment.empty()) {
            size_t eq = segment.find('=');
            if (eq == std::string_view::npos) {
                pairs.emplace_back(form_decode(segment), std::string());
            } else {
                pairs.emplace_back(form_decode(segment.substr(0, eq)), form_decode(segment.substr(eq + 1)));
            }
        }
        start = end + 1;
    }
    return pairs;
}

} // namespace

std::string form_encode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        auto byte = static_cast<unsigned char>(c);
        if ((byte >= 'a' && byte <= 'z') || (byte >= 'A' && byte <= 'Z') || (byte >= '0' && byte <= '9') ||
            byte == '*' || byte == '-' || byte == '.' || byte == '_') {
            out += c;
        } else if (byte == ' ') {
            out += '+';
        } else {
            out += '%';
            out += kHexDigits[byte >> 4];
            out += kHexDigits[byte & 0x0F];
        }
    }
    return out;
}

std::string form_decode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < text.size() && hex_value(text[i + 1]) >= 0 && hex_value(text[i + 2]) >= 0) {
            out += static_cast<char>(hex_value(text[i + 1]) * 16 + hex_value(text[i + 2]));
            i += 2;
        } else {
            // malformed escapes pass through unchanged
            out += c;
        }
    }
    return out;
}

QueryString to_query_string(const Request<MethodCall>& request) {
    std::string out;
    if (request.id()) {
        try {
            append_pair(out, kQueryIdKey, id_to_json(*request.id()).dump());
        } catch (const nlohmann::json::exception& exc) {
            throw TransportError(std::string("pack error: ") + exc.what());
        }
    }
    append_pair(out, kQueryMethodKey, request.method().name);

    const nlohmann::json& params = request.method().params;
    if (!params.is_null()) {
        if (!params.is_object()) {
            throw TransportError("invalid data: params must be object");
        }
        for (auto it = params.begin(); it != params.end(); ++it) {
            append_pair(out, it.key(), scalar_to_string(it.key(), it.value()));
        }
    }
    return QueryString(std::move(out));
}

Request<MethodCall> from_query_string(const QueryString& query) {
    std::optional<Id> id;
    std::optional<std::string> method;
    nlohmann::json params = nlohmann::json::object();

    auto pairs = split_pairs(query.str());
    for (size_t i = 0; i < pairs.size(); ++i) {
        const auto& [name, value] = pairs[i];
        if (name == kQueryIdKey && i == 0) {
            try {
                id = parse_optional_id(nlohmann::json::parse(value));
            } catch (const nlohmann::json::exception& exc) {
                throw TransportError(std::string("pack error: ") + exc.what());
            } catch (const codec::CodecError& exc) {
                throw TransportError(std::string("pack error: ") + exc.what());
            }
        } else if (name == kQueryMethodKey && !method) {
            method = value;
        } else {
            params[name] = parse_scalar(value);
        }
    }

    if (!method) {
        LOG4CPLUS_DEBUG(transport_logger(), "Query string without method: " << query);
        throw TransportError("invalid data: the method is missing");
    }
    return Request<MethodCall>::from_parts(std::move(id), MethodCall{std::move(*method), std::move(params)});
}

} // namespace jrpc::transport
