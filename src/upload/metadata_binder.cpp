#include "tidelink/upload/metadata_binder.h"

#include "tidelink/core/time.h"

namespace tidelink::upload {

MetadataBinder::MetadataBinder(std::shared_ptr<metadata::MetadataStore> store)
    : store_(std::move(store)) {}

core::Result<void> MetadataBinder::AttachUpload(const std::string& transfer_id,
                                                const std::string& session_id,
                                                const std::string& declared_name,
                                                std::uint64_t declared_size,
                                                const std::string& content_type) {
    auto transfer = store_->GetTransfer(transfer_id);
    if (!transfer.ok()) {
        if (transfer.error().code == core::ErrorCode::kNotFound) {
            return core::Error{core::ErrorCode::kReferenceNotFound, "transfer not found"};
        }
        return transfer.error();
    }
    if (transfer.value().status == metadata::kTransferDeleted ||
        core::IsPastIso8601(transfer.value().expires_at)) {
        return core::Error{core::ErrorCode::kReferenceNotFound, "transfer has expired"};
    }

    metadata::FileRecord file;
    file.id = session_id;
    file.transfer_id = transfer_id;
    file.original_name = declared_name;
    file.mime_type = content_type;
    file.size = declared_size;
    auto created = store_->CreateFile(file);
    if (!created.ok()) {
        return created.error();
    }
    return core::Ok();
}

core::Result<void> MetadataBinder::MarkComplete(const std::string& session_id,
                                                std::uint64_t final_size) {
    return store_->MarkFileComplete(session_id, final_size);
}

core::Result<void> MetadataBinder::DetachUpload(const std::string& session_id) {
    return store_->DeleteFile(session_id);
}

}  // namespace tidelink::upload
