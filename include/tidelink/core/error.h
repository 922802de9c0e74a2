#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace tidelink::core {

/// @brief Canonical error codes used across modules and mapped to HTTP responses.
enum class ErrorCode {
    kOk = 0,
    kInvalidArgument,
    kNotFound,
    kAlreadyExists,
    kReferenceNotFound,
    kOffsetMismatch,
    kConflict,
    kOversizedChunk,
    kSizeLimitExceeded,
    kStorageDesync,
    kIoError,
    kDbError,
    kInternal,
};

/// @brief Error payload describing a failure with a code and human-readable message.
struct Error {
    ErrorCode code{ErrorCode::kOk};
    std::string message;
    /// Authoritative upload offset, set for kOffsetMismatch.
    std::optional<std::uint64_t> offset;
};

/// @brief Stable upper-case name for an error code, used in JSON error envelopes.
const char* ErrorCodeName(ErrorCode code);

}  // namespace tidelink::core
