#pragma once

#include <string>
#include <utility>
#include <vector>

namespace vidlift::core {

/// @brief Key/value pair rendered into a structured log line. Values are emitted as strings.
using LogField = std::pair<std::string, std::string>;

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
/// @brief Log a structured JSON line `{"event":..., fields...}` at information level.
void LogEvent(const std::string& event, const std::vector<LogField>& fields);

}  // namespace vidlift::core
