#include "tidelink/upload/upload_manager.h"

#include "tidelink/core/ids.h"
#include "tidelink/core/logger.h"
#include "tidelink/observability/metrics.h"

namespace tidelink::upload {

namespace {

std::string MetadataOr(const UploadMetadata& metadata, const char* key,
                       const std::string& fallback) {
    auto it = metadata.find(key);
    if (it == metadata.end() || it->second.empty()) {
        return fallback;
    }
    return it->second;
}

core::Result<void> FirstError(const core::Result<void>& a, const core::Result<void>& b) {
    if (!a.ok()) {
        return a;
    }
    return b;
}

}  // namespace

UploadSessionManager::UploadSessionManager(std::shared_ptr<OffsetStore> offsets,
                                           std::shared_ptr<storage::BlobWriter> blobs,
                                           std::shared_ptr<MetadataBinder> binder,
                                           UploadLimits limits)
    : offsets_(std::move(offsets)),
      blobs_(std::move(blobs)),
      binder_(std::move(binder)),
      limits_(limits),
      locks_(limits.lock_shards) {}

core::Result<SessionHandle> UploadSessionManager::CreateSession(std::uint64_t declared_size,
                                                                const UploadMetadata& metadata,
                                                                std::string_view initial_bytes) {
    if (declared_size > limits_.max_size_bytes) {
        return core::Error{core::ErrorCode::kSizeLimitExceeded,
                           "upload length exceeds " + std::to_string(limits_.max_size_bytes)};
    }
    const auto transfer_id = MetadataOr(metadata, kMetaTransferId, "");
    if (transfer_id.empty()) {
        return core::Error{core::ErrorCode::kInvalidArgument, "transferId metadata is required"};
    }
    if (initial_bytes.size() > declared_size) {
        return core::Error{core::ErrorCode::kOversizedChunk, "initial data exceeds upload length"};
    }

    const auto id = core::GenerateUploadId();
    auto guard = locks_.Acquire(id);

    auto attached = binder_->AttachUpload(transfer_id, id,
                                          MetadataOr(metadata, kMetaFilename, "unknown"),
                                          declared_size,
                                          MetadataOr(metadata, kMetaFiletype,
                                                     "application/octet-stream"));
    if (!attached.ok()) {
        return attached.error();
    }

    auto blob = blobs_->CreateEmpty(id);
    if (!blob.ok()) {
        auto detached = binder_->DetachUpload(id);
        if (!detached.ok()) {
            core::LogError("rollback of file record " + id + " failed: " +
                           detached.error().message);
        }
        return blob.error();
    }

    auto record = offsets_->Create(id, declared_size, metadata);
    if (!record.ok()) {
        auto removed = RemoveArtifacts(id);
        if (!removed.ok()) {
            core::LogError("rollback of upload " + id + " failed: " + removed.error().message);
        }
        return record.error();
    }

    observability::RecordSessionCreated();
    core::LogInfo("upload " + id + " created for transfer " + transfer_id + " size=" +
                  std::to_string(declared_size));

    SessionHandle handle;
    handle.id = id;
    if (declared_size == 0) {
        auto finalized = Finalize(record.value());
        if (!finalized.ok()) {
            auto removed = RemoveArtifacts(id);
            if (!removed.ok()) {
                core::LogError("rollback of upload " + id + " failed: " +
                               removed.error().message);
            }
            return finalized.error();
        }
        handle.complete = true;
        return handle;
    }

    if (!initial_bytes.empty()) {
        auto appended = AppendLocked(record.value(), 0, initial_bytes);
        if (!appended.ok()) {
            auto removed = RemoveArtifacts(id);
            if (!removed.ok()) {
                core::LogError("rollback of upload " + id + " failed: " +
                               removed.error().message);
            }
            return appended.error();
        }
        handle.offset = appended.value().offset;
        handle.complete = appended.value().complete;
    }
    return handle;
}

core::Result<AppendResult> UploadSessionManager::AppendChunk(const std::string& id,
                                                             std::uint64_t claimed_offset,
                                                             std::string_view bytes) {
    if (!IsValidSessionId(id)) {
        return core::Error{core::ErrorCode::kNotFound, "upload not found"};
    }
    auto guard = locks_.Acquire(id);
    auto record = offsets_->Get(id);
    if (!record.ok()) {
        return record.error();
    }

    // Offset reached the end but finalization did not stick; finish it now.
    if (!record.value().complete && record.value().offset == record.value().declared_size) {
        auto finalized = Finalize(record.value());
        if (!finalized.ok()) {
            return finalized.error();
        }
        record.value().complete = true;
    }
    return AppendLocked(record.value(), claimed_offset, bytes);
}

core::Result<AppendResult> UploadSessionManager::AppendLocked(const UploadRecord& record,
                                                              std::uint64_t claimed_offset,
                                                              std::string_view bytes) {
    if (record.complete) {
        return core::Error{core::ErrorCode::kConflict, "upload is already complete"};
    }
    if (claimed_offset != record.offset) {
        observability::RecordOffsetMismatch();
        core::Error error{core::ErrorCode::kOffsetMismatch,
                          "expected offset " + std::to_string(record.offset)};
        error.offset = record.offset;
        return error;
    }
    if (bytes.size() > record.declared_size - record.offset) {
        return core::Error{core::ErrorCode::kOversizedChunk,
                           "chunk exceeds remaining " +
                               std::to_string(record.declared_size - record.offset) + " bytes"};
    }
    if (bytes.empty()) {
        return AppendResult{record.offset, false};
    }

    auto length = blobs_->Length(record.id);
    if (!length.ok()) {
        return length.error();
    }
    if (length.value() > record.offset) {
        // Bytes past the committed offset were never acknowledged to the client.
        core::LogWarning("upload " + record.id + " discarding " +
                         std::to_string(length.value() - record.offset) + " unacknowledged bytes");
        auto truncated = blobs_->Truncate(record.id, record.offset);
        if (!truncated.ok()) {
            return truncated.error();
        }
    } else if (length.value() < record.offset) {
        observability::RecordStorageDesync();
        core::LogError("upload " + record.id + " storage desync: blob holds " +
                       std::to_string(length.value()) + " bytes, record says " +
                       std::to_string(record.offset));
        return core::Error{core::ErrorCode::kStorageDesync, "blob shorter than recorded offset"};
    }

    auto appended = blobs_->AppendAt(record.id, record.offset, bytes);
    if (!appended.ok()) {
        if (appended.error().code == core::ErrorCode::kStorageDesync) {
            observability::RecordStorageDesync();
            core::LogError("upload " + record.id + " storage desync: " +
                           appended.error().message);
        }
        return appended.error();
    }

    const auto new_offset = appended.value();
    core::LogDebug("upload " + record.id + " wrote " + std::to_string(bytes.size()) +
                   " bytes at offset " + std::to_string(record.offset));
    auto stored = offsets_->Put(record.id, new_offset);
    if (!stored.ok()) {
        auto truncated = blobs_->Truncate(record.id, record.offset);
        if (!truncated.ok()) {
            core::LogError("upload " + record.id + " could not drop unrecorded chunk: " +
                           truncated.error().message);
        }
        return stored.error();
    }
    observability::RecordBytesAccepted(bytes.size());

    AppendResult result{new_offset, false};
    if (new_offset == record.declared_size) {
        UploadRecord advanced = record;
        advanced.offset = new_offset;
        auto finalized = Finalize(advanced);
        if (!finalized.ok()) {
            return finalized.error();
        }
        result.complete = true;
    }
    return result;
}

core::Result<void> UploadSessionManager::Finalize(const UploadRecord& record) {
    auto bound = binder_->MarkComplete(record.id, record.offset);
    if (!bound.ok()) {
        core::LogError("upload " + record.id + " could not finalize file record: " +
                       bound.error().message);
        return bound.error();
    }
    auto marked = offsets_->MarkComplete(record.id);
    if (!marked.ok()) {
        return marked.error();
    }
    observability::RecordSessionCompleted();
    core::LogInfo("upload " + record.id + " complete size=" + std::to_string(record.offset));
    return core::Ok();
}

core::Result<SessionStatus> UploadSessionManager::GetStatus(const std::string& id) {
    if (!IsValidSessionId(id)) {
        return core::Error{core::ErrorCode::kNotFound, "upload not found"};
    }
    // Records are replaced by atomic rename, so an unlocked read sees a whole record.
    auto record = offsets_->Get(id);
    if (!record.ok()) {
        return record.error();
    }
    if (!record.value().complete && record.value().offset == record.value().declared_size) {
        // A client that sees offset == length stops sending, so finish the upload here.
        auto guard = locks_.Acquire(id);
        record = offsets_->Get(id);
        if (!record.ok()) {
            return record.error();
        }
        if (!record.value().complete && record.value().offset == record.value().declared_size) {
            core::LogDebug("upload " + id + " finalizing on status read");
            auto finalized = Finalize(record.value());
            if (!finalized.ok()) {
                return finalized.error();
            }
            record.value().complete = true;
        }
    }
    SessionStatus status;
    status.offset = record.value().offset;
    status.declared_size = record.value().declared_size;
    status.complete = record.value().complete;
    status.metadata = record.value().metadata;
    return status;
}

core::Result<void> UploadSessionManager::CancelSession(const std::string& id) {
    if (!IsValidSessionId(id)) {
        return core::Ok();
    }
    auto guard = locks_.Acquire(id);
    auto record = offsets_->Get(id);
    if (!record.ok()) {
        if (record.error().code == core::ErrorCode::kNotFound) {
            return core::Ok();
        }
        return record.error();
    }
    if (record.value().complete) {
        return core::Error{core::ErrorCode::kConflict, "completed uploads cannot be cancelled"};
    }
    auto removed = RemoveArtifacts(id);
    if (!removed.ok()) {
        return removed;
    }
    observability::RecordSessionCancelled();
    core::LogInfo("upload " + id + " cancelled at offset " +
                  std::to_string(record.value().offset));
    return core::Ok();
}

core::Result<void> UploadSessionManager::PurgeSession(const std::string& id) {
    if (!IsValidSessionId(id)) {
        return binder_->DetachUpload(id);
    }
    auto guard = locks_.Acquire(id);
    auto removed = RemoveArtifacts(id);
    if (removed.ok()) {
        core::LogInfo("upload " + id + " purged");
    }
    return removed;
}

core::Result<void> UploadSessionManager::RemoveArtifacts(const std::string& id) {
    // The record goes last so a partially failed removal can be retried.
    auto detached = binder_->DetachUpload(id);
    auto deleted = blobs_->Delete(id);
    auto removed = FirstError(detached, deleted);
    if (!removed.ok()) {
        return removed;
    }
    return offsets_->Delete(id);
}

}  // namespace tidelink::upload
