#pragma once

#include <atomic>

namespace tidelink::core {

/// @brief Process-wide lifecycle state owned by main and injected where needed.
class ProcessLifecycle {
public:
    /// Returns true exactly once; later callers see the cleanup job already running.
    bool TryStartCleanup() { return !cleanup_started_.exchange(true); }
    bool cleanup_started() const { return cleanup_started_.load(); }

    void RequestShutdown() { shutting_down_.store(true); }
    bool shutting_down() const { return shutting_down_.load(); }

private:
    std::atomic<bool> cleanup_started_{false};
    std::atomic<bool> shutting_down_{false};
};

}  // namespace tidelink::core
