#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "tidelink/core/error.h"
#include "tidelink/core/result.h"

namespace tidelink::metadata {

inline constexpr const char* kTransferPending = "pending";
inline constexpr const char* kTransferComplete = "complete";
inline constexpr const char* kTransferDeleted = "deleted";

/// @brief A shareable group of files behind one link.
struct Transfer {
    std::string id;
    std::string title;
    std::string message;
    std::string status{kTransferPending};
    std::string expires_at;
    std::string created_at;
    int download_count{0};
    std::uint64_t total_size{0};
};

/// @brief One uploaded file; id equals the upload session id.
struct FileRecord {
    std::string id;
    std::string transfer_id;
    std::string original_name;
    std::string mime_type;
    std::uint64_t size{0};
    bool upload_complete{false};
    std::string created_at;
};

/// @brief Abstract metadata store interface for transfers and their files.
class MetadataStore {
public:
    virtual ~MetadataStore() = default;

    virtual core::Result<Transfer> CreateTransfer(const Transfer& transfer) = 0;
    virtual core::Result<Transfer> GetTransfer(const std::string& id) = 0;
    virtual core::Result<std::vector<Transfer>> ListExpiredTransfers(
        const std::string& expires_before, int limit) = 0;
    virtual core::Result<void> UpdateTransferStatus(const std::string& id,
                                                    const std::string& status) = 0;
    /// @brief Mark complete and total the sizes of finished files.
    virtual core::Result<Transfer> CompleteTransfer(const std::string& id) = 0;
    virtual core::Result<void> IncrementDownloadCount(const std::string& id) = 0;

    virtual core::Result<FileRecord> CreateFile(const FileRecord& file) = 0;
    virtual core::Result<FileRecord> GetFile(const std::string& id) = 0;
    virtual core::Result<std::vector<FileRecord>> ListFiles(const std::string& transfer_id,
                                                            bool completed_only) = 0;
    virtual core::Result<void> MarkFileComplete(const std::string& id,
                                                std::uint64_t final_size) = 0;
    virtual core::Result<void> DeleteFile(const std::string& id) = 0;
};

}  // namespace tidelink::metadata
