#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "tidelink/core/result.h"
#include "tidelink/storage/blob_writer.h"
#include "tidelink/upload/metadata_binder.h"
#include "tidelink/upload/offset_store.h"
#include "tidelink/upload/session_lock.h"
#include "tidelink/upload/upload_session.h"

namespace tidelink::upload {

struct UploadLimits {
    std::uint64_t max_size_bytes{107374182400ULL};
    std::size_t lock_shards{16};
};

/// @brief Resumable upload state machine: Created -> Receiving -> Complete, or Cancelled.
///
/// Every call reloads the record from the offset store; mutations on one id are
/// serialized through the lock table while distinct ids run in parallel.
class UploadSessionManager {
public:
    UploadSessionManager(std::shared_ptr<OffsetStore> offsets,
                         std::shared_ptr<storage::BlobWriter> blobs,
                         std::shared_ptr<MetadataBinder> binder, UploadLimits limits);

    /// @brief Start a session; initial_bytes, when present, are appended at offset 0
    /// and the whole session is rolled back if that append fails.
    core::Result<SessionHandle> CreateSession(std::uint64_t declared_size,
                                              const UploadMetadata& metadata,
                                              std::string_view initial_bytes = {});
    core::Result<AppendResult> AppendChunk(const std::string& id, std::uint64_t claimed_offset,
                                           std::string_view bytes);
    core::Result<SessionStatus> GetStatus(const std::string& id);
    /// @brief Client cancellation; unknown ids succeed, completed uploads are kConflict.
    core::Result<void> CancelSession(const std::string& id);
    /// @brief Retention removal of every artifact of id, completed or not.
    core::Result<void> PurgeSession(const std::string& id);

    std::uint64_t max_size_bytes() const { return limits_.max_size_bytes; }

private:
    core::Result<AppendResult> AppendLocked(const UploadRecord& record,
                                            std::uint64_t claimed_offset, std::string_view bytes);
    core::Result<void> Finalize(const UploadRecord& record);
    core::Result<void> RemoveArtifacts(const std::string& id);

    std::shared_ptr<OffsetStore> offsets_;
    std::shared_ptr<storage::BlobWriter> blobs_;
    std::shared_ptr<MetadataBinder> binder_;
    UploadLimits limits_;
    SessionLockTable locks_;
};

}  // namespace tidelink::upload
