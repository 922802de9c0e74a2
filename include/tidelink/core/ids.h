#pragma once

#include <string>

namespace tidelink::core {

/// @brief Generate a unique request ID for correlation.
std::string GenerateRequestId();
/// @brief Generate a transfer ID (canonical UUID text).
std::string GenerateTransferId();
/// @brief Generate an upload session ID: 32 lowercase hex chars, safe as a file name.
std::string GenerateUploadId();

}  // namespace tidelink::core
