#include "tidelink/upload/upload_session.h"

#include "tidelink/upload/offset_store.h"

namespace tidelink::upload {

bool IsValidSessionId(const std::string& id) {
    if (id.size() != 32) {
        return false;
    }
    for (char c : id) {
        const bool digit = c >= '0' && c <= '9';
        const bool hex_lower = c >= 'a' && c <= 'f';
        if (!digit && !hex_lower) {
            return false;
        }
    }
    return true;
}

core::Result<void> ValidateOffsetUpdate(const UploadRecord& record, std::uint64_t offset) {
    if (offset < record.offset) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "offset for " + record.id + " cannot move backwards"};
    }
    if (offset > record.declared_size) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "offset for " + record.id + " exceeds declared size"};
    }
    return core::Ok();
}

}  // namespace tidelink::upload
