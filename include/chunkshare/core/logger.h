#pragma once

#include <string>
#include <utility>
#include <vector>

namespace chunkshare::core {

using LogFields = std::vector<std::pair<std::string, std::string>>;

void InitLogging(const std::string& level);
void LogInfo(const std::string& message);
void LogWarning(const std::string& message);
void LogError(const std::string& message);
void LogDebug(const std::string& message);
/// @brief Log a structured JSON line for HTTP requests.
void LogRequest(const std::string& request_id,
                const std::string& method,
                const std::string& target,
                const std::string& remote,
                int status,
                long long latency_ms);
/// @brief Log a structured JSON line `{"event":<event>, <fields>...}`; values are strings.
void LogEvent(const std::string& event, const LogFields& fields);

}  // namespace chunkshare::core
