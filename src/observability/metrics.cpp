#include "chunkshare/observability/metrics.h"

#include <atomic>

namespace chunkshare::observability {
namespace {
std::atomic<std::uint64_t> g_total_requests{0};
std::atomic<std::uint64_t> g_requests_2xx{0};
std::atomic<std::uint64_t> g_requests_4xx{0};
std::atomic<std::uint64_t> g_requests_5xx{0};
std::atomic<std::uint64_t> g_latency_ms_total{0};
std::atomic<std::uint64_t> g_chunks_accepted{0};
std::atomic<std::uint64_t> g_chunk_bytes{0};
std::atomic<std::uint64_t> g_finalize_ready{0};
std::atomic<std::uint64_t> g_finalize_failed{0};
std::atomic<std::uint64_t> g_downloads{0};

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
    if (status_code >= 200 && status_code < 400) {
        g_requests_2xx.fetch_add(1, std::memory_order_relaxed);
    } else if (status_code >= 400 && status_code < 500) {
        g_requests_4xx.fetch_add(1, std::memory_order_relaxed);
    } else if (status_code >= 500) {
        g_requests_5xx.fetch_add(1, std::memory_order_relaxed);
    }
}

void RecordChunkAccepted(std::uint64_t bytes) {
    g_chunks_accepted.fetch_add(1, std::memory_order_relaxed);
    g_chunk_bytes.fetch_add(bytes, std::memory_order_relaxed);
}

void RecordFinalize(bool ready) {
    (ready ? g_finalize_ready : g_finalize_failed).fetch_add(1, std::memory_order_relaxed);
}

void RecordDownload() { g_downloads.fetch_add(1, std::memory_order_relaxed); }

std::string RenderMetrics() {
    return "# HELP chunkshare_up 1 if server is up\n"
           "# TYPE chunkshare_up gauge\n"
           "chunkshare_up 1\n" +
           Counter("chunkshare_http_requests_total", "Total HTTP requests processed",
                   g_total_requests) +
           Counter("chunkshare_http_requests_2xx", "Total 2xx/3xx responses", g_requests_2xx) +
           Counter("chunkshare_http_requests_4xx", "Total 4xx responses", g_requests_4xx) +
           Counter("chunkshare_http_requests_5xx", "Total 5xx responses", g_requests_5xx) +
           Counter("chunkshare_http_request_latency_ms_sum", "Sum of request latencies in ms",
                   g_latency_ms_total) +
           Counter("chunkshare_chunks_accepted_total", "Chunks newly stored", g_chunks_accepted) +
           Counter("chunkshare_chunk_bytes_total", "Bytes of newly stored chunks", g_chunk_bytes) +
           Counter("chunkshare_finalize_ready_total", "Uploads promoted to ready",
                   g_finalize_ready) +
           Counter("chunkshare_finalize_failed_total", "Uploads that failed finalize",
                   g_finalize_failed) +
           Counter("chunkshare_downloads_total", "Validated downloads served", g_downloads);
}

}  // namespace chunkshare::observability
