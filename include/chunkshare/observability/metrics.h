#pragma once

#include <cstdint>
#include <string>

namespace chunkshare::observability {

/// @brief Render Prometheus-style metrics for the `/metrics` endpoint.
std::string RenderMetrics();
/// @brief Record a completed HTTP request for metrics.
void RecordRequest(int status_code, long long latency_ms);
void RecordChunkAccepted(std::uint64_t bytes);
void RecordFinalize(bool ready);
void RecordDownload();

}  // namespace chunkshare::observability
