#include "../../include/sitewatch/crawler/CrawlLogger.h"
#include "../../include/sitewatch/common/Logger.h"

namespace sitewatch::crawler {

std::mutex CrawlLogger::mutex_;
CrawlLogger::LogBroadcastFunction CrawlLogger::logBroadcastFunction_ = nullptr;
CrawlLogger::RunLogBroadcastFunction CrawlLogger::runLogBroadcastFunction_ = nullptr;

void CrawlLogger::setLogBroadcastFunction(LogBroadcastFunction func) {
    std::lock_guard<std::mutex> lock(mutex_);
    logBroadcastFunction_ = std::move(func);
}

void CrawlLogger::setRunLogBroadcastFunction(RunLogBroadcastFunction func) {
    std::lock_guard<std::mutex> lock(mutex_);
    runLogBroadcastFunction_ = std::move(func);
}

void CrawlLogger::broadcastLog(const std::string& message, const std::string& level) {
    LogBroadcastFunction sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sink = logBroadcastFunction_;
    }
    if (sink) {
        sink(message, level);
    }
}

void CrawlLogger::broadcastSessionLog(const std::string& runId, const std::string& message, const std::string& level) {
    RunLogBroadcastFunction runSink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        runSink = runLogBroadcastFunction_;
    }
    if (runSink) {
        runSink(runId, message, level);
        return;
    }
    LOG_TRACE("No run log sink set, using general broadcast for run " + runId);
    broadcastLog(message + " (Run: " + runId + ")", level);
}

} // namespace sitewatch::crawler
