#pragma once

#include <memory>

#include "tidelink/core/config.h"
#include "tidelink/http/router.h"

namespace tidelink::metadata {
class MetadataStore;
}

namespace tidelink::http {

/// Registers health, metrics and transfer management routes into the provided router.
void RegisterDefaultRoutes(Router& router, std::shared_ptr<metadata::MetadataStore> metadata,
                           const core::Config& config);

}  // namespace tidelink::http
