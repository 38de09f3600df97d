#include "CrawlFrontier.h"
#include "../../include/sitewatch/common/Logger.h"
#include "../../include/sitewatch/common/UrlUtils.h"

namespace sitewatch::crawler {

CrawlFrontier::CrawlFrontier() {
    LOG_DEBUG("CrawlFrontier constructor called");
}

bool CrawlFrontier::addURL(const std::string& url, int depth, const std::string& parentUrl) {
    const std::string key = common::normalizeUrl(url);
    if (!seen_.insert(key).second) {
        LOG_TRACE("URL already known, skipping: " + key);
        return false;
    }

    queue_.push_back(FrontierEntry{common::stripFragment(common::sanitizeUrl(url)), depth, parentUrl});
    LOG_DEBUG("Added URL to queue: " + key + " (depth " + std::to_string(depth) +
              ", queue size: " + std::to_string(queue_.size()) + ")");
    return true;
}

std::optional<FrontierEntry> CrawlFrontier::getNextURL() {
    if (queue_.empty()) {
        return std::nullopt;
    }
    FrontierEntry entry = std::move(queue_.front());
    queue_.pop_front();
    return entry;
}

void CrawlFrontier::markVisited(const std::string& url) {
    const std::string key = common::normalizeUrl(url);
    seen_.insert(key);
    visited_.insert(key);
}

void CrawlFrontier::markFailed(const std::string& url) {
    const std::string key = common::normalizeUrl(url);
    seen_.insert(key);
    failed_.insert(key);
}

bool CrawlFrontier::isVisited(const std::string& url) const {
    return visited_.count(common::normalizeUrl(url)) > 0;
}

bool CrawlFrontier::isFailed(const std::string& url) const {
    return failed_.count(common::normalizeUrl(url)) > 0;
}

bool CrawlFrontier::isKnown(const std::string& url) const {
    return seen_.count(common::normalizeUrl(url)) > 0;
}

} // namespace sitewatch::crawler
