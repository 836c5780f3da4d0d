#pragma once

#include <cstdint>
#include <string>

namespace vidlift::observability {

/// @brief Render Prometheus-style metrics for the `/metrics` endpoint.
std::string RenderMetrics();
/// @brief Record a completed HTTP request for metrics.
void RecordRequest(int status_code, long long latency_ms);

void RecordSessionInitialized(bool resumed);
void RecordPartReceived(std::uint64_t bytes);
void RecordSessionFinalized();
void RecordFinalizeRejected();
void RecordSessionsExpired(int count);
void RecordThumbnailStored();

}  // namespace vidlift::observability
