#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace tidelink::upload {

/// Client-supplied key/value pairs from Upload-Metadata; immutable after creation.
using UploadMetadata = std::map<std::string, std::string>;

/// @brief Persisted state of one resumable upload.
struct UploadRecord {
    std::string id;
    std::uint64_t declared_size{0};
    /// Bytes durably written; the only valid start offset for the next chunk.
    std::uint64_t offset{0};
    UploadMetadata metadata;
    /// Set once the owning file record has been finalized.
    bool complete{false};
    std::string created_at;
};

/// @brief Returned by session creation.
struct SessionHandle {
    std::string id;
    std::uint64_t offset{0};
    bool complete{false};
};

/// @brief Read-only view served to status probes.
struct SessionStatus {
    std::uint64_t offset{0};
    std::uint64_t declared_size{0};
    bool complete{false};
    UploadMetadata metadata;
};

/// @brief Outcome of an accepted chunk.
struct AppendResult {
    std::uint64_t offset{0};
    bool complete{false};
};

/// Well-known metadata keys.
inline constexpr const char* kMetaTransferId = "transferId";
inline constexpr const char* kMetaFilename = "filename";
inline constexpr const char* kMetaFiletype = "filetype";

/// @brief Upload ids are 32 lowercase hex characters.
bool IsValidSessionId(const std::string& id);

}  // namespace tidelink::upload
