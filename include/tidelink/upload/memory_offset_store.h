#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

#include "tidelink/upload/offset_store.h"

namespace tidelink::upload {

/// @brief Volatile offset store; progress is lost on restart.
class MemoryOffsetStore : public OffsetStore {
public:
    core::Result<UploadRecord> Create(const std::string& id, std::uint64_t declared_size,
                                      const UploadMetadata& metadata) override;
    core::Result<UploadRecord> Get(const std::string& id) override;
    core::Result<void> Put(const std::string& id, std::uint64_t offset) override;
    core::Result<void> MarkComplete(const std::string& id) override;
    core::Result<void> Delete(const std::string& id) override;

private:
    std::mutex mutex_;
    std::unordered_map<std::string, UploadRecord> records_;
};

}  // namespace tidelink::upload
