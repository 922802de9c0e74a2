#pragma once

#include <cstdint>
#include <string>

#include "tidelink/core/result.h"
#include "tidelink/upload/upload_session.h"

namespace tidelink::upload {

/// @brief Keyed store of upload progress; the single source of truth for resumption.
///
/// A successful Put must be visible to every later Get, including from another
/// thread or after a process restart for durable implementations.
class OffsetStore {
public:
    virtual ~OffsetStore() = default;

    virtual core::Result<UploadRecord> Create(const std::string& id, std::uint64_t declared_size,
                                              const UploadMetadata& metadata) = 0;
    virtual core::Result<UploadRecord> Get(const std::string& id) = 0;
    virtual core::Result<void> Put(const std::string& id, std::uint64_t offset) = 0;
    virtual core::Result<void> MarkComplete(const std::string& id) = 0;
    /// @brief Remove the record; deleting a missing record succeeds.
    virtual core::Result<void> Delete(const std::string& id) = 0;
};

/// @brief Rejects offsets that move backwards or past the declared size.
core::Result<void> ValidateOffsetUpdate(const UploadRecord& record, std::uint64_t offset);

}  // namespace tidelink::upload
