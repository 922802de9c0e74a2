#include "tidelink/core/ids.h"

#include <algorithm>

#include <Poco/UUIDGenerator.h>

namespace tidelink::core {

std::string GenerateRequestId() {
    return Poco::UUIDGenerator().createOne().toString();
}

std::string GenerateTransferId() {
    return Poco::UUIDGenerator().createRandom().toString();
}

std::string GenerateUploadId() {
    auto id = Poco::UUIDGenerator().createRandom().toString();
    id.erase(std::remove(id.begin(), id.end(), '-'), id.end());
    return id;
}

}  // namespace tidelink::core
