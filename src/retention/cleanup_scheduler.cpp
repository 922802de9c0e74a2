#include "tidelink/retention/cleanup_scheduler.h"

#include <boost/system/error_code.hpp>

#include "tidelink/core/logger.h"

namespace tidelink::retention {

CleanupScheduler::CleanupScheduler(boost::asio::io_context& ioc,
                                   std::shared_ptr<CleanupService> service,
                                   core::ProcessLifecycle& lifecycle,
                                   std::chrono::seconds interval)
    : ioc_(ioc), service_(std::move(service)), lifecycle_(lifecycle), interval_(interval) {}

bool CleanupScheduler::Start() {
    if (!lifecycle_.TryStartCleanup()) {
        core::LogWarning("Cleanup job already running; ignoring second start");
        return false;
    }
    timer_ = std::make_unique<boost::asio::steady_timer>(ioc_);
    core::LogInfo("Cleanup job scheduled every " + std::to_string(interval_.count()) + "s");
    Schedule(std::chrono::seconds(0));
    return true;
}

void CleanupScheduler::Stop() {
    if (timer_) {
        timer_->cancel();
    }
}

void CleanupScheduler::Schedule(std::chrono::steady_clock::duration delay) {
    if (!timer_) {
        return;
    }
    timer_->expires_after(delay);
    timer_->async_wait([this](const boost::system::error_code& ec) {
        if (ec || lifecycle_.shutting_down()) {
            return;
        }
        RunOnce();
        Schedule(interval_);
    });
}

void CleanupScheduler::RunOnce() {
    auto swept = service_->RunSweep();
    if (swept.ok() && swept.value() > 0) {
        core::LogInfo("Cleanup sweep removed " + std::to_string(swept.value()) + " transfers");
    }
}

}  // namespace tidelink::retention
