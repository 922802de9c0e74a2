#pragma once

#include <cstddef>
#include <memory>

#include "tidelink/core/result.h"
#include "tidelink/metadata/metadata_store.h"
#include "tidelink/upload/upload_manager.h"

namespace tidelink::retention {

/// @brief Removes the uploads of expired transfers and marks those transfers deleted.
class CleanupService {
public:
    CleanupService(std::shared_ptr<metadata::MetadataStore> metadata,
                   std::shared_ptr<upload::UploadSessionManager> uploads,
                   int max_transfers_per_sweep);

    /// @brief One pass; returns the number of transfers marked deleted.
    core::Result<std::size_t> RunSweep();

private:
    std::shared_ptr<metadata::MetadataStore> metadata_;
    std::shared_ptr<upload::UploadSessionManager> uploads_;
    int max_transfers_per_sweep_;
};

}  // namespace tidelink::retention
