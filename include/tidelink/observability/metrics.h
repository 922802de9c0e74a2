#pragma once

#include <cstdint>
#include <string>

namespace tidelink::observability {

/// @brief Render Prometheus-style metrics for a minimal `/metrics` endpoint.
std::string RenderMetrics();
/// @brief Record a completed HTTP request for metrics.
void RecordRequest(int status_code, long long latency_ms);

void RecordSessionCreated();
void RecordSessionCompleted();
void RecordSessionCancelled();
void RecordBytesAccepted(std::uint64_t bytes);
void RecordOffsetMismatch();
void RecordStorageDesync();

}  // namespace tidelink::observability
