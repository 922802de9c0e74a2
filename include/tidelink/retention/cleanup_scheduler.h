#pragma once

#include <chrono>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "tidelink/core/lifecycle.h"
#include "tidelink/retention/cleanup_service.h"

namespace tidelink::retention {

/// @brief Periodic sweep on the server io_context; runs once immediately, then every interval.
class CleanupScheduler {
public:
    CleanupScheduler(boost::asio::io_context& ioc, std::shared_ptr<CleanupService> service,
                     core::ProcessLifecycle& lifecycle, std::chrono::seconds interval);

    /// @brief Returns false when the process already started its cleanup job.
    bool Start();
    void Stop();

private:
    void Schedule(std::chrono::steady_clock::duration delay);
    void RunOnce();

    boost::asio::io_context& ioc_;
    std::shared_ptr<CleanupService> service_;
    core::ProcessLifecycle& lifecycle_;
    std::chrono::seconds interval_;
    std::unique_ptr<boost::asio::steady_timer> timer_;
};

}  // namespace tidelink::retention
