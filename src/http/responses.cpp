#include "tidelink/http/responses.h"

#include "tidelink/core/logger.h"

namespace tidelink::http {

HttpResponse JsonOk(int version, const std::string& body, boost::beast::http::status status) {
    HttpResponse response{status, version};
    response.set(boost::beast::http::field::content_type, "application/json");
    response.body() = body;
    response.prepare_payload();
    return response;
}

HttpResponse JsonError(int version, const std::string& code, const std::string& message,
                       const std::string& request_id, boost::beast::http::status status) {
    HttpResponse response{status, version};
    response.set(boost::beast::http::field::content_type, "application/json");
    response.body() = "{\"error\":{\"code\":\"" + code + "\",\"message\":\"" +
                      core::EscapeJson(message) + "\",\"request_id\":\"" + request_id + "\"}}";
    response.prepare_payload();
    return response;
}

boost::beast::http::status StatusFor(core::ErrorCode code) {
    using boost::beast::http::status;
    switch (code) {
        case core::ErrorCode::kOk:
            return status::ok;
        case core::ErrorCode::kInvalidArgument:
            return status::bad_request;
        case core::ErrorCode::kNotFound:
        case core::ErrorCode::kReferenceNotFound:
            return status::not_found;
        case core::ErrorCode::kAlreadyExists:
        case core::ErrorCode::kOffsetMismatch:
        case core::ErrorCode::kConflict:
            return status::conflict;
        case core::ErrorCode::kOversizedChunk:
        case core::ErrorCode::kSizeLimitExceeded:
            return status::payload_too_large;
        case core::ErrorCode::kStorageDesync:
        case core::ErrorCode::kIoError:
        case core::ErrorCode::kDbError:
        case core::ErrorCode::kInternal:
            return status::internal_server_error;
    }
    return status::internal_server_error;
}

HttpResponse ErrorResponse(int version, const core::Error& error, const std::string& request_id) {
    auto response = JsonError(version, core::ErrorCodeName(error.code), error.message, request_id,
                              StatusFor(error.code));
    if (error.offset) {
        response.set("Upload-Offset", std::to_string(*error.offset));
    }
    return response;
}

std::string PublicBaseUrl(const core::ServerConfig& server, const HttpRequest& request) {
    if (!server.public_base_url.empty()) {
        return server.public_base_url;
    }
    std::string host(request[boost::beast::http::field::host]);
    if (host.empty()) {
        host = server.host + ":" + std::to_string(server.port);
    }
    return std::string(server.tls.enabled ? "https" : "http") + "://" + host;
}

}  // namespace tidelink::http
