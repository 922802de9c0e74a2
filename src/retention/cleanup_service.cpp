#include "tidelink/retention/cleanup_service.h"

#include "tidelink/core/logger.h"
#include "tidelink/core/time.h"

namespace tidelink::retention {

CleanupService::CleanupService(std::shared_ptr<metadata::MetadataStore> metadata,
                               std::shared_ptr<upload::UploadSessionManager> uploads,
                               int max_transfers_per_sweep)
    : metadata_(std::move(metadata)),
      uploads_(std::move(uploads)),
      max_transfers_per_sweep_(max_transfers_per_sweep) {}

core::Result<std::size_t> CleanupService::RunSweep() {
    auto expired = metadata_->ListExpiredTransfers(core::NowIso8601(), max_transfers_per_sweep_);
    if (!expired.ok()) {
        core::LogError("Cleanup sweep failed to list transfers: " + expired.error().message);
        return expired.error();
    }

    std::size_t swept = 0;
    for (const auto& transfer : expired.value()) {
        auto files = metadata_->ListFiles(transfer.id, false);
        if (!files.ok()) {
            core::LogError("Cleanup sweep failed to list files of " + transfer.id + ": " +
                           files.error().message);
            continue;
        }

        bool purged_all = true;
        for (const auto& file : files.value()) {
            auto purged = uploads_->PurgeSession(file.id);
            if (!purged.ok()) {
                purged_all = false;
                core::LogError("Cleanup sweep failed to purge upload " + file.id + ": " +
                               purged.error().message);
            }
        }
        // Leave the transfer for the next sweep until every upload is gone.
        if (!purged_all) {
            continue;
        }

        auto marked = metadata_->UpdateTransferStatus(transfer.id, metadata::kTransferDeleted);
        if (!marked.ok()) {
            core::LogError("Cleanup sweep failed to mark " + transfer.id + " deleted: " +
                           marked.error().message);
            continue;
        }
        ++swept;
        core::LogInfo("Transfer " + transfer.id + " expired; removed " +
                      std::to_string(files.value().size()) + " files");
    }
    return swept;
}

}  // namespace tidelink::retention
