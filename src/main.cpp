#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <Poco/Exception.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "tidelink/core/config.h"
#include "tidelink/core/lifecycle.h"
#include "tidelink/core/logger.h"
#include "tidelink/http/http_server.h"
#include "tidelink/http/route_registration.h"
#include "tidelink/http/router.h"
#include "tidelink/http/upload_routes.h"
#include "tidelink/metadata/sqlite_metadata_store.h"
#include "tidelink/retention/cleanup_scheduler.h"
#include "tidelink/retention/cleanup_service.h"
#include "tidelink/storage/blob_writer.h"
#include "tidelink/upload/file_offset_store.h"
#include "tidelink/upload/memory_offset_store.h"
#include "tidelink/upload/metadata_binder.h"
#include "tidelink/upload/upload_manager.h"

namespace {

std::string GetArgValue(int argc, char** argv, const std::string& key,
                        const std::string& default_value) {
    for (int i = 1; i < argc - 1; ++i) {
        if (argv[i] == key) {
            return argv[i + 1];
        }
    }
    return default_value;
}

std::shared_ptr<tidelink::upload::OffsetStore> MakeOffsetStore(
    const tidelink::core::Config& config, const tidelink::storage::BlobWriter& blobs) {
    if (config.upload.offset_store == "memory") {
        tidelink::core::LogWarning("Using in-memory offset store; uploads will not survive restart");
        return std::make_shared<tidelink::upload::MemoryOffsetStore>();
    }
    return std::make_shared<tidelink::upload::FileOffsetStore>(blobs.root());
}

int Run(int argc, char** argv) {
    const std::string config_path = GetArgValue(argc, argv, "--config", "config/server.json");
    const std::string db_path = GetArgValue(argc, argv, "--database", "config/database.json");

    auto config = tidelink::core::LoadConfig(config_path);
    tidelink::core::InitLogging(config.observability.log_level);

    auto sqlite_path = tidelink::core::LoadDatabasePath(db_path);
    const auto sqlite_dir = std::filesystem::path(sqlite_path).parent_path();
    if (!sqlite_dir.empty()) {
        std::filesystem::create_directories(sqlite_dir);
    }
    auto metadata = std::make_shared<tidelink::metadata::SqliteMetadataStore>(sqlite_path);
    auto blobs = std::make_shared<tidelink::storage::BlobWriter>(config.storage.base_path);
    auto offsets = MakeOffsetStore(config, *blobs);
    auto binder = std::make_shared<tidelink::upload::MetadataBinder>(metadata);

    tidelink::upload::UploadLimits limits;
    limits.max_size_bytes = config.upload.max_size_bytes;
    limits.lock_shards = static_cast<std::size_t>(config.upload.lock_shards);
    auto uploads =
        std::make_shared<tidelink::upload::UploadSessionManager>(offsets, blobs, binder, limits);

    tidelink::http::Router router;
    tidelink::http::RegisterDefaultRoutes(router, metadata, config);
    tidelink::http::RegisterUploadRoutes(router, uploads, config);

    boost::asio::io_context ioc(config.server.threads);
    tidelink::core::ProcessLifecycle lifecycle;

    auto cleanup = std::make_shared<tidelink::retention::CleanupService>(
        metadata, uploads, config.cleanup.max_transfers_per_sweep);
    tidelink::retention::CleanupScheduler scheduler(
        ioc, cleanup, lifecycle, std::chrono::seconds(config.cleanup.sweep_interval_seconds));
    if (config.cleanup.enabled) {
        scheduler.Start();
    }

    tidelink::http::HttpServer server(ioc, config, std::move(router), blobs, metadata);
    server.Run();
    tidelink::core::LogInfo("Listening on " + config.server.host + ":" +
                            std::to_string(config.server.port));

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
        if (ec) {
            return;
        }
        tidelink::core::LogInfo("Shutting down on signal " + std::to_string(signal_number));
        lifecycle.RequestShutdown();
        scheduler.Stop();
        ioc.stop();
    });

    std::vector<std::thread> threads;
    threads.reserve(static_cast<size_t>(config.server.threads));
    for (int i = 0; i < config.server.threads; ++i) {
        threads.emplace_back([&ioc]() { ioc.run(); });
    }
    for (auto& t : threads) {
        t.join();
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        return Run(argc, argv);
    } catch (const Poco::Exception& ex) {
        std::cerr << "tidelink: " << ex.displayText() << std::endl;
    } catch (const std::exception& ex) {
        std::cerr << "tidelink: " << ex.what() << std::endl;
    }
    return EXIT_FAILURE;
}
