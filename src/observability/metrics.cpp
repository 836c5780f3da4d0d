#include "vidlift/observability/metrics.h"

#include <atomic>

namespace vidlift::observability {
namespace {
std::atomic<std::uint64_t> g_total_requests{0};
std::atomic<std::uint64_t> g_requests_2xx{0};
std::atomic<std::uint64_t> g_requests_4xx{0};
std::atomic<std::uint64_t> g_requests_5xx{0};
std::atomic<std::uint64_t> g_latency_ms_total{0};

std::atomic<std::uint64_t> g_sessions_initialized{0};
std::atomic<std::uint64_t> g_sessions_resumed{0};
std::atomic<std::uint64_t> g_parts_received{0};
std::atomic<std::uint64_t> g_part_bytes_received{0};
std::atomic<std::uint64_t> g_sessions_finalized{0};
std::atomic<std::uint64_t> g_finalize_rejected{0};
std::atomic<std::uint64_t> g_sessions_expired{0};
std::atomic<std::uint64_t> g_thumbnails_stored{0};

std::string Counter(const std::string& name, const std::string& help,
                    const std::atomic<std::uint64_t>& value) {
    return "# HELP " + name + " " + help + "\n# TYPE " + name + " counter\n" + name + " " +
           std::to_string(value.load(std::memory_order_relaxed)) + "\n";
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

void RecordSessionInitialized(bool resumed) {
    g_sessions_initialized.fetch_add(1, std::memory_order_relaxed);
    if (resumed) {
        g_sessions_resumed.fetch_add(1, std::memory_order_relaxed);
    }
}

void RecordPartReceived(std::uint64_t bytes) {
    g_parts_received.fetch_add(1, std::memory_order_relaxed);
    g_part_bytes_received.fetch_add(bytes, std::memory_order_relaxed);
}

void RecordSessionFinalized() { g_sessions_finalized.fetch_add(1, std::memory_order_relaxed); }

void RecordFinalizeRejected() { g_finalize_rejected.fetch_add(1, std::memory_order_relaxed); }

void RecordSessionsExpired(int count) {
    if (count > 0) {
        g_sessions_expired.fetch_add(static_cast<std::uint64_t>(count), std::memory_order_relaxed);
    }
}

void RecordThumbnailStored() { g_thumbnails_stored.fetch_add(1, std::memory_order_relaxed); }

std::string RenderMetrics() {
    return "# HELP vidlift_up 1 if server is up\n"
           "# TYPE vidlift_up gauge\n"
           "vidlift_up 1\n" +
           Counter("vidlift_http_requests_total", "Total HTTP requests processed",
                   g_total_requests) +
           Counter("vidlift_http_requests_2xx", "Total 2xx responses", g_requests_2xx) +
           Counter("vidlift_http_requests_4xx", "Total 4xx responses", g_requests_4xx) +
           Counter("vidlift_http_requests_5xx", "Total 5xx responses", g_requests_5xx) +
           Counter("vidlift_http_request_latency_ms_sum", "Sum of request latencies in ms",
                   g_latency_ms_total) +
           Counter("vidlift_upload_sessions_initialized_total", "Upload sessions issued",
                   g_sessions_initialized) +
           Counter("vidlift_upload_sessions_resumed_total", "Upload sessions resumed",
                   g_sessions_resumed) +
           Counter("vidlift_upload_parts_received_total", "Parts stored", g_parts_received) +
           Counter("vidlift_upload_part_bytes_received_total", "Part bytes stored",
                   g_part_bytes_received) +
           Counter("vidlift_upload_sessions_finalized_total", "Sessions finalized",
                   g_sessions_finalized) +
           Counter("vidlift_upload_finalize_rejected_total", "Finalize calls rejected",
                   g_finalize_rejected) +
           Counter("vidlift_upload_sessions_expired_total", "Sessions expired by the sweep",
                   g_sessions_expired) +
           Counter("vidlift_thumbnails_stored_total", "Thumbnails stored", g_thumbnails_stored);
}

}  // namespace vidlift::observability
