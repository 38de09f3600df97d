#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <unordered_set>

namespace sitewatch::crawler {

struct FrontierEntry {
    std::string url;
    int depth = 0;
    std::string parentUrl;
};

// FIFO work queue of one crawl run. URLs are keyed by their normalized form;
// a URL that was ever queued is never queued again, so cyclic link graphs
// drain in finite time.
class CrawlFrontier {
public:
    CrawlFrontier();

    // Returns false when the URL is already queued, visited or failed.
    bool addURL(const std::string& url, int depth, const std::string& parentUrl = "");

    // Next entry in discovery order, or std::nullopt when the queue is empty.
    std::optional<FrontierEntry> getNextURL();

    void markVisited(const std::string& url);
    void markFailed(const std::string& url);

    bool isVisited(const std::string& url) const;
    bool isFailed(const std::string& url) const;

    // Queued, visited or failed.
    bool isKnown(const std::string& url) const;

    size_t size() const { return queue_.size(); }
    bool isEmpty() const { return queue_.empty(); }
    size_t visitedCount() const { return visited_.size(); }
    size_t failedCount() const { return failed_.size(); }

private:
    std::deque<FrontierEntry> queue_;
    std::unordered_set<std::string> seen_;
    std::unordered_set<std::string> visited_;
    std::unordered_set<std::string> failed_;
};

} // namespace sitewatch::crawler
