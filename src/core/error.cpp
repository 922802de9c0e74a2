#include "tidelink/core/error.h"

namespace tidelink::core {

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return "OK";
        case ErrorCode::kInvalidArgument:
            return "INVALID_ARGUMENT";
        case ErrorCode::kNotFound:
            return "NOT_FOUND";
        case ErrorCode::kAlreadyExists:
            return "ALREADY_EXISTS";
        case ErrorCode::kReferenceNotFound:
            return "REFERENCE_NOT_FOUND";
        case ErrorCode::kOffsetMismatch:
            return "OFFSET_MISMATCH";
        case ErrorCode::kConflict:
            return "CONFLICT";
        case ErrorCode::kOversizedChunk:
            return "OVERSIZED_CHUNK";
        case ErrorCode::kSizeLimitExceeded:
            return "SIZE_LIMIT_EXCEEDED";
        case ErrorCode::kStorageDesync:
            return "STORAGE_DESYNC";
        case ErrorCode::kIoError:
            return "IO_ERROR";
        case ErrorCode::kDbError:
            return "DB_ERROR";
        case ErrorCode::kInternal:
            return "INTERNAL";
    }
    return "INTERNAL";
}

}  // namespace tidelink::core
