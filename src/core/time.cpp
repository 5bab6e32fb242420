#include "chunkshare/core/time.h"

#include <Poco/DateTime.h>
#include <Poco/DateTimeFormat.h>
#include <Poco/DateTimeFormatter.h>
#include <Poco/DateTimeParser.h>
#include <Poco/Timespan.h>
#include <Poco/Timestamp.h>

namespace chunkshare::core {

std::string NowIso8601() {
    return Poco::DateTimeFormatter::format(Poco::Timestamp(), Poco::DateTimeFormat::ISO8601_FORMAT);
}

std::string NowIso8601WithOffsetSeconds(std::int64_t delta_seconds) {
    Poco::Timestamp ts;
    ts += Poco::Timespan(static_cast<long>(delta_seconds), 0);
    return Poco::DateTimeFormatter::format(ts, Poco::DateTimeFormat::ISO8601_FORMAT);
}

std::int64_t NowEpochSeconds() {
    return static_cast<std::int64_t>(Poco::Timestamp().epochTime());
}

std::string FormatEpochSeconds(std::int64_t epoch_seconds) {
    const auto ts = Poco::Timestamp::fromEpochTime(static_cast<std::time_t>(epoch_seconds));
    return Poco::DateTimeFormatter::format(ts, Poco::DateTimeFormat::ISO8601_FORMAT);
}

std::optional<std::int64_t> ParseTimestamp(const std::string& value) {
    Poco::DateTime parsed;
    int tzd = 0;
    if (value.empty() || !Poco::DateTimeParser::tryParse(value, parsed, tzd)) {
        return std::nullopt;
    }
    parsed.makeUTC(tzd);
    return static_cast<std::int64_t>(parsed.timestamp().epochTime());
}

bool IsPast(const std::string& iso) {
    const auto parsed = ParseTimestamp(iso);
    if (!parsed) {
        return true;
    }
    return *parsed < NowEpochSeconds();
}

}  // namespace chunkshare::core
