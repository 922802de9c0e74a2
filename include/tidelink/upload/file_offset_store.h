#pragma once

#include <string>

#include "tidelink/upload/offset_store.h"

namespace tidelink::upload {

/// @brief Offset store keeping one JSON side file per upload next to its blob.
///
/// Records are replaced by writing a temp file in the same directory, syncing it
/// and renaming over the old one, so readers never observe a torn record.
class FileOffsetStore : public OffsetStore {
public:
    explicit FileOffsetStore(std::string record_dir);

    core::Result<UploadRecord> Create(const std::string& id, std::uint64_t declared_size,
                                      const UploadMetadata& metadata) override;
    core::Result<UploadRecord> Get(const std::string& id) override;
    core::Result<void> Put(const std::string& id, std::uint64_t offset) override;
    core::Result<void> MarkComplete(const std::string& id) override;
    core::Result<void> Delete(const std::string& id) override;

    std::string RecordPath(const std::string& id) const;

private:
    core::Result<void> Write(const UploadRecord& record);

    std::string record_dir_;
};

}  // namespace tidelink::upload
