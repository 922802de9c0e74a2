#include "tidelink/upload/memory_offset_store.h"

#include "tidelink/core/time.h"

namespace tidelink::upload {

core::Result<UploadRecord> MemoryOffsetStore::Create(const std::string& id,
                                                     std::uint64_t declared_size,
                                                     const UploadMetadata& metadata) {
    UploadRecord record;
    record.id = id;
    record.declared_size = declared_size;
    record.metadata = metadata;
    record.created_at = core::NowIso8601();

    std::lock_guard<std::mutex> lock(mutex_);
    auto inserted = records_.emplace(id, record);
    if (!inserted.second) {
        return core::Error{core::ErrorCode::kAlreadyExists, "upload record exists"};
    }
    return record;
}

core::Result<UploadRecord> MemoryOffsetStore::Get(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return core::Error{core::ErrorCode::kNotFound, "upload not found"};
    }
    return it->second;
}

core::Result<void> MemoryOffsetStore::Put(const std::string& id, std::uint64_t offset) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return core::Error{core::ErrorCode::kNotFound, "upload not found"};
    }
    auto valid = ValidateOffsetUpdate(it->second, offset);
    if (!valid.ok()) {
        return valid.error();
    }
    it->second.offset = offset;
    return core::Ok();
}

core::Result<void> MemoryOffsetStore::MarkComplete(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return core::Error{core::ErrorCode::kNotFound, "upload not found"};
    }
    if (it->second.offset != it->second.declared_size) {
        return core::Error{core::ErrorCode::kInvalidArgument, "upload is not fully written"};
    }
    it->second.complete = true;
    return core::Ok();
}

core::Result<void> MemoryOffsetStore::Delete(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.erase(id);
    return core::Ok();
}

}  // namespace tidelink::upload
