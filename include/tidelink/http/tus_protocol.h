#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "tidelink/core/result.h"
#include "tidelink/http/router.h"
#include "tidelink/upload/upload_session.h"

namespace tidelink::http::tus {

inline constexpr const char* kVersion = "1.0.0";
inline constexpr const char* kExtensions = "creation,creation-with-upload,termination";
inline constexpr const char* kChunkContentType = "application/offset+octet-stream";

inline constexpr const char* kHeaderResumable = "Tus-Resumable";
inline constexpr const char* kHeaderVersion = "Tus-Version";
inline constexpr const char* kHeaderExtension = "Tus-Extension";
inline constexpr const char* kHeaderMaxSize = "Tus-Max-Size";
inline constexpr const char* kHeaderUploadOffset = "Upload-Offset";
inline constexpr const char* kHeaderUploadLength = "Upload-Length";
inline constexpr const char* kHeaderUploadMetadata = "Upload-Metadata";

/// @brief Parse a non-negative decimal header value (Upload-Length, Upload-Offset).
core::Result<std::uint64_t> ParseUnsignedHeader(std::string_view value, const std::string& name);

/// @brief Decode "key base64value,key2 base64value2"; a key may appear without a value.
core::Result<upload::UploadMetadata> ParseUploadMetadata(std::string_view header);
std::string EncodeUploadMetadata(const upload::UploadMetadata& metadata);

/// @brief True for "/files" and anything below it; the query string is ignored.
bool IsUploadPath(std::string_view target);

/// @brief Version, extension, size ceiling and CORS headers carried by every upload response.
void ApplyProtocolHeaders(boost::beast::http::response_header<>& response, std::uint64_t max_size);

}  // namespace tidelink::http::tus
