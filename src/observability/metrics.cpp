#include "tidelink/observability/metrics.h"

#include <atomic>

namespace tidelink::observability {
namespace {
std::atomic<std::uint64_t> g_total_requests{0};
std::atomic<std::uint64_t> g_requests_2xx{0};
std::atomic<std::uint64_t> g_requests_4xx{0};
std::atomic<std::uint64_t> g_requests_5xx{0};
std::atomic<std::uint64_t> g_latency_ms_total{0};

std::atomic<std::uint64_t> g_sessions_created{0};
std::atomic<std::uint64_t> g_sessions_completed{0};
std::atomic<std::uint64_t> g_sessions_cancelled{0};
std::atomic<std::uint64_t> g_bytes_accepted{0};
std::atomic<std::uint64_t> g_offset_mismatches{0};
std::atomic<std::uint64_t> g_storage_desyncs{0};

std::string Counter(const char* name, const char* help, const std::atomic<std::uint64_t>& value) {
    return std::string("# HELP ") + name + " " + help + "\n# TYPE " + name + " counter\n" +
           name + " " + std::to_string(value.load(std::memory_order_relaxed)) + "\n";
}
}  // namespace

void RecordRequest(int status_code, long long latency_ms) {
    g_total_requests.fetch_add(1, std::memory_order_relaxed);
    g_latency_ms_total.fetch_add(static_cast<std::uint64_t>(latency_ms),
                                 std::memory_order_relaxed);
    if (status_code >= 200 && status_code < 300) {
        g_requests_2xx.fetch_add(1, std::memory_order_relaxed);
    } else if (status_code >= 400 && status_code < 500) {
        g_requests_4xx.fetch_add(1, std::memory_order_relaxed);
    } else if (status_code >= 500) {
        g_requests_5xx.fetch_add(1, std::memory_order_relaxed);
    }
}

void RecordSessionCreated() { g_sessions_created.fetch_add(1, std::memory_order_relaxed); }
void RecordSessionCompleted() { g_sessions_completed.fetch_add(1, std::memory_order_relaxed); }
void RecordSessionCancelled() { g_sessions_cancelled.fetch_add(1, std::memory_order_relaxed); }

void RecordBytesAccepted(std::uint64_t bytes) {
    g_bytes_accepted.fetch_add(bytes, std::memory_order_relaxed);
}

void RecordOffsetMismatch() { g_offset_mismatches.fetch_add(1, std::memory_order_relaxed); }
void RecordStorageDesync() { g_storage_desyncs.fetch_add(1, std::memory_order_relaxed); }

std::string RenderMetrics() {
    std::string out =
        "# HELP tidelink_up 1 if server is up\n"
        "# TYPE tidelink_up gauge\n"
        "tidelink_up 1\n";
    out += Counter("tidelink_http_requests_total", "Total HTTP requests processed",
                   g_total_requests);
    out += Counter("tidelink_http_requests_2xx", "Total 2xx responses", g_requests_2xx);
    out += Counter("tidelink_http_requests_4xx", "Total 4xx responses", g_requests_4xx);
    out += Counter("tidelink_http_requests_5xx", "Total 5xx responses", g_requests_5xx);
    out += Counter("tidelink_http_request_latency_ms_sum", "Sum of request latencies in ms",
                   g_latency_ms_total);
    out += Counter("tidelink_upload_sessions_created_total", "Upload sessions created",
                   g_sessions_created);
    out += Counter("tidelink_upload_sessions_completed_total", "Upload sessions completed",
                   g_sessions_completed);
    out += Counter("tidelink_upload_sessions_cancelled_total", "Upload sessions cancelled",
                   g_sessions_cancelled);
    out += Counter("tidelink_upload_bytes_accepted_total", "Chunk bytes durably appended",
                   g_bytes_accepted);
    out += Counter("tidelink_upload_offset_mismatches_total", "Appends rejected on offset",
                   g_offset_mismatches);
    out += Counter("tidelink_upload_storage_desyncs_total", "Blob length disagreed with record",
                   g_storage_desyncs);
    return out;
}

}  // namespace tidelink::observability
