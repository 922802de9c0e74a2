#pragma once

#include <string>

#include <boost/beast/http/status.hpp>

#include "tidelink/core/config.h"
#include "tidelink/core/error.h"
#include "tidelink/http/router.h"

namespace tidelink::http {

HttpResponse JsonOk(int version, const std::string& body,
                    boost::beast::http::status status = boost::beast::http::status::ok);
/// @brief JSON error envelope {"error":{"code","message","request_id"}}.
HttpResponse JsonError(int version, const std::string& code, const std::string& message,
                       const std::string& request_id, boost::beast::http::status status);
/// @brief HTTP status for a domain error code.
boost::beast::http::status StatusFor(core::ErrorCode code);
HttpResponse ErrorResponse(int version, const core::Error& error, const std::string& request_id);

/// @brief Externally visible origin, e.g. "https://files.example.com".
///
/// Uses server.public_base_url when set, otherwise the request Host header.
std::string PublicBaseUrl(const core::ServerConfig& server, const HttpRequest& request);

}  // namespace tidelink::http
