#pragma once

#include <memory>

#include "tidelink/core/config.h"
#include "tidelink/http/router.h"
#include "tidelink/upload/upload_manager.h"

namespace tidelink::http {

/// Registers the tus endpoints under /files and the Tus-Resumable version check.
void RegisterUploadRoutes(Router& router, std::shared_ptr<upload::UploadSessionManager> uploads,
                          const core::Config& config);

}  // namespace tidelink::http
