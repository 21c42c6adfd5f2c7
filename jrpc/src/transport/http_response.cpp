#include "http_response.hpp"

namespace jrpc::transport {

namespace {

void validate_header_value(const std::string& value) {
    for (char c : value) {
        auto byte = static_cast<unsigned char>(c);
        if ((byte < 0x20 && byte != '\t') || byte == 0x7F) {
            throw TransportError("invalid data: failed to parse id as http header: invalid character");
        }
    }
}

} // namespace

HttpResponse make_http_response(const Id& id, bool success, const nlohmann::json& outcome) {
    std::string id_text = scalar_to_string("", id_to_json(id));
    validate_header_value(id_text);

    std::string body;
    try {
        body = outcome.dump();
    } catch (const nlohmann::json::exception& exc) {
        throw TransportError(std::string("pack error: ") + exc.what());
    }

    HttpResponse::HeaderMap headers;
    headers[kContentTypeHeader] = kJsonContentType;
    headers[kIdHeader] = id_text;
    return HttpResponse(success ? kHttpOk : kHttpInternalServerError, std::move(headers), std::move(body));
}

} // namespace jrpc::transport
