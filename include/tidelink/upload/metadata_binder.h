#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "tidelink/core/result.h"
#include "tidelink/metadata/metadata_store.h"

namespace tidelink::upload {

/// @brief Links upload sessions to the transfer-owned file records.
///
/// These three calls are the only writes the upload engine makes to transfer state.
class MetadataBinder {
public:
    explicit MetadataBinder(std::shared_ptr<metadata::MetadataStore> store);

    /// @brief Register a file stub; kReferenceNotFound when the transfer is missing,
    /// deleted or expired.
    core::Result<void> AttachUpload(const std::string& transfer_id, const std::string& session_id,
                                    const std::string& declared_name, std::uint64_t declared_size,
                                    const std::string& content_type);
    core::Result<void> MarkComplete(const std::string& session_id, std::uint64_t final_size);
    core::Result<void> DetachUpload(const std::string& session_id);

private:
    std::shared_ptr<metadata::MetadataStore> store_;
};

}  // namespace tidelink::upload
