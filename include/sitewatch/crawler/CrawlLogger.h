#pragma once
#include <functional>
#include <mutex>
#include <string>

namespace sitewatch::crawler {

// Fan-out for crawl progress messages. The daemon installs sinks at startup;
// without a sink every broadcast is a no-op, which keeps tests quiet.
class CrawlLogger {
public:
    using LogBroadcastFunction = std::function<void(const std::string& message, const std::string& level)>;
    using RunLogBroadcastFunction = std::function<void(const std::string& runId, const std::string& message, const std::string& level)>;

    static void setLogBroadcastFunction(LogBroadcastFunction func);
    static void setRunLogBroadcastFunction(RunLogBroadcastFunction func);

    static void broadcastLog(const std::string& message, const std::string& level = "info");

    // Falls back to the general sink (with the run id appended) when no run sink is set.
    static void broadcastSessionLog(const std::string& runId, const std::string& message, const std::string& level = "info");

private:
    static std::mutex mutex_;
    static LogBroadcastFunction logBroadcastFunction_;
    static RunLogBroadcastFunction runLogBroadcastFunction_;
};

} // namespace sitewatch::crawler
