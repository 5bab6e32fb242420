#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace chunkshare::core {

// Timestamps are persisted as fixed-width ISO8601 UTC strings ("2026-01-02T03:04:05Z"), so
// lexicographic order in SQL equals chronological order.

/// @brief Returns the current time formatted as ISO8601 UTC.
std::string NowIso8601();
/// @brief Returns a UTC ISO8601 timestamp offset from now by delta seconds.
std::string NowIso8601WithOffsetSeconds(std::int64_t delta_seconds);
/// @brief Seconds since the Unix epoch.
std::int64_t NowEpochSeconds();
/// @brief Format epoch seconds as ISO8601 UTC.
std::string FormatEpochSeconds(std::int64_t epoch_seconds);
/// @brief Parse any ISO8601/RFC timestamp Poco understands; offsets are normalised to UTC.
std::optional<std::int64_t> ParseTimestamp(const std::string& value);
/// @brief True when `iso` parses and lies strictly before now; unparseable values count as past.
bool IsPast(const std::string& iso);

}  // namespace chunkshare::core
