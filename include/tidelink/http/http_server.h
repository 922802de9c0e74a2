#pragma once

#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include "tidelink/core/config.h"
#include "tidelink/http/router.h"
#include "tidelink/metadata/metadata_store.h"
#include "tidelink/storage/blob_writer.h"

namespace tidelink::http {

/// @brief HTTP server bootstrapper (acceptor + TLS context).
///
/// File downloads bypass the router and stream straight from the blob store.
class HttpServer {
public:
    HttpServer(boost::asio::io_context& ioc, const core::Config& config, Router router,
               std::shared_ptr<storage::BlobWriter> blobs,
               std::shared_ptr<metadata::MetadataStore> metadata);
    void Run();

private:
    boost::asio::io_context& ioc_;
    core::Config config_;
    Router router_;
    std::shared_ptr<storage::BlobWriter> blobs_;
    std::shared_ptr<metadata::MetadataStore> metadata_;
    std::unique_ptr<boost::asio::ssl::context> ssl_context_;
};

}  // namespace tidelink::http
