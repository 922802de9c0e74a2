#pragma once

#include <mutex>
#include <string>

#include <Poco/Data/Session.h>

#include "tidelink/metadata/metadata_store.h"

namespace tidelink::metadata {

/// @brief SQLite-backed metadata store for single-node mode.
class SqliteMetadataStore : public MetadataStore {
public:
    explicit SqliteMetadataStore(const std::string& db_path);

    core::Result<Transfer> CreateTransfer(const Transfer& transfer) override;
    core::Result<Transfer> GetTransfer(const std::string& id) override;
    core::Result<std::vector<Transfer>> ListExpiredTransfers(const std::string& expires_before,
                                                             int limit) override;
    core::Result<void> UpdateTransferStatus(const std::string& id,
                                            const std::string& status) override;
    core::Result<Transfer> CompleteTransfer(const std::string& id) override;
    core::Result<void> IncrementDownloadCount(const std::string& id) override;

    core::Result<FileRecord> CreateFile(const FileRecord& file) override;
    core::Result<FileRecord> GetFile(const std::string& id) override;
    core::Result<std::vector<FileRecord>> ListFiles(const std::string& transfer_id,
                                                    bool completed_only) override;
    core::Result<void> MarkFileComplete(const std::string& id, std::uint64_t final_size) override;
    core::Result<void> DeleteFile(const std::string& id) override;

private:
    // Schema creation is done once per store instance; in production this will be migrated.
    void InitSchema();
    core::Result<Transfer> GetTransferLocked(const std::string& id);
    core::Result<FileRecord> GetFileLocked(const std::string& id);

    // Poco::Data::Session is not safe for concurrent use by the request threads.
    std::mutex mutex_;
    Poco::Data::Session session_;
};

}  // namespace tidelink::metadata
