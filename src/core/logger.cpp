#include "chunkshare/core/logger.h"

#include <sstream>

#include <Poco/AutoPtr.h>
#include <Poco/ConsoleChannel.h>
#include <Poco/FormattingChannel.h>
#include <Poco/JSON/Object.h>
#include <Poco/Logger.h>
#include <Poco/PatternFormatter.h>

namespace chunkshare::core {

namespace {

Poco::Logger& RootLogger() {
    return Poco::Logger::get("chunkshare");
}

int ToPocoLevel(const std::string& level) {
    if (level == "trace") {
        return Poco::Message::PRIO_TRACE;
    }
    if (level == "debug") {
        return Poco::Message::PRIO_DEBUG;
    }
    if (level == "warning") {
        return Poco::Message::PRIO_WARNING;
    }
    if (level == "error") {
        return Poco::Message::PRIO_ERROR;
    }
    return Poco::Message::PRIO_INFORMATION;
}

// Structured lines are single-line JSON objects; Poco handles the escaping.
std::string ToLine(const Poco::JSON::Object& object) {
    std::ostringstream out;
    object.stringify(out);
    return out.str();
}

}  // namespace

void InitLogging(const std::string& level) {
    Poco::AutoPtr<Poco::ConsoleChannel> console(new Poco::ConsoleChannel());
    Poco::AutoPtr<Poco::PatternFormatter> formatter(
        new Poco::PatternFormatter("%Y-%m-%dT%H:%M:%S.%iZ [%p] %s: %t"));
    formatter->setProperty("times", "UTC");
    Poco::AutoPtr<Poco::FormattingChannel> channel(new Poco::FormattingChannel(formatter, console));
    RootLogger().setChannel(channel);
    RootLogger().setLevel(ToPocoLevel(level));
}

void LogInfo(const std::string& message) { RootLogger().information(message); }
void LogWarning(const std::string& message) { RootLogger().warning(message); }
void LogError(const std::string& message) { RootLogger().error(message); }
void LogDebug(const std::string& message) { RootLogger().debug(message); }

void LogRequest(const std::string& request_id,
                const std::string& method,
                const std::string& target,
                const std::string& remote,
                int status,
                long long latency_ms) {
    Poco::JSON::Object line(Poco::JSON_PRESERVE_KEY_ORDER);
    line.set("event", "http_request");
    line.set("request_id", request_id);
    line.set("method", method);
    line.set("target", target);
    line.set("remote", remote);
    line.set("status", status);
    line.set("latency_ms", static_cast<Poco::Int64>(latency_ms));
    if (status >= 500) {
        RootLogger().error(ToLine(line));
    } else {
        RootLogger().information(ToLine(line));
    }
}

void LogEvent(const std::string& event, const LogFields& fields) {
    Poco::JSON::Object line(Poco::JSON_PRESERVE_KEY_ORDER);
    line.set("event", event);
    for (const auto& [key, value] : fields) {
        line.set(key, value);
    }
    RootLogger().information(ToLine(line));
}

}  // namespace chunkshare::core
