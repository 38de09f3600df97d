#pragma once

#include "../../include/sitewatch/scheduler/CrawlRunner.h"
#include "../../include/sitewatch/common/Hashing.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace sitewatch::testing {

// CrawlRunner returning a scripted result. With `blockUntilCancelled` set the
// run parks until its token trips, which lets tests hold a run in flight.
class FakeCrawlRunner : public scheduler::CrawlRunner {
public:
    crawler::CrawlResult run(const storage::CrawlJob& job,
                             const std::optional<auth::AuthConfig>& credential,
                             const std::string& runId,
                             const common::CancellationToken& cancel) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            lastCredential_ = credential;
            lastRunId_ = runId;
        }
        ++calls;
        started = true;

        if (blockUntilCancelled) {
            while (cancel.waitFor(std::chrono::milliseconds(10))) {
            }
            crawler::CrawlResult cancelled;
            cancelled.baseUrl = job.baseUrl;
            cancelled.summary.cancelled = true;
            return cancelled;
        }
        if (!throwMessage.empty()) {
            throw std::runtime_error(throwMessage);
        }

        std::lock_guard<std::mutex> lock(mutex_);
        crawler::CrawlResult result = result_;
        result.baseUrl = job.baseUrl;
        return result;
    }

    void addPage(const std::string& url, const std::string& content) {
        std::lock_guard<std::mutex> lock(mutex_);
        crawler::ScrapedPage page;
        page.url = url;
        page.finalUrl = url;
        page.statusCode = 200;
        page.title = "Title of " + url;
        page.content = content;
        page.contentHash = common::sha256Hex(content);
        result_.pages.push_back(page);
        result_.summary.successfulPages = result_.pages.size();
        result_.summary.totalPages = result_.pages.size() + result_.errors.size();
    }

    void addError(crawler::CrawlError error) {
        std::lock_guard<std::mutex> lock(mutex_);
        result_.errors.push_back(std::move(error));
        result_.summary.failedPages = result_.errors.size();
        result_.summary.totalPages = result_.pages.size() + result_.errors.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        result_ = crawler::CrawlResult();
    }

    std::optional<auth::AuthConfig> lastCredential() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastCredential_;
    }

    std::atomic<int> calls{0};
    std::atomic<bool> started{false};
    std::atomic<bool> blockUntilCancelled{false};
    std::string throwMessage;

private:
    mutable std::mutex mutex_;
    crawler::CrawlResult result_;
    std::optional<auth::AuthConfig> lastCredential_;
    std::string lastRunId_;
};

} // namespace sitewatch::testing
