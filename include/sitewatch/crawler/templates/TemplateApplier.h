#pragma once
#include "TemplateTypes.h"
#include "../models/CrawlOptions.h"
#include <chrono>

namespace sitewatch {
namespace crawler {
namespace templates {

// Copies a template's limits, URL patterns and behaviour flags onto crawl
// options. Job-level overrides are applied by the caller afterwards.
inline void applyTemplateToOptions(const WebsiteTemplate& t, CrawlOptions& options) {
    options.maxDepth = t.crawl.maxDepth;
    options.maxPages = t.crawl.maxPages;
    options.waitForDynamic = t.crawl.waitForDynamic;
    options.timeout = std::chrono::milliseconds(t.crawl.timeoutMs);
    options.delayBetweenRequests = std::chrono::milliseconds(t.crawl.delayBetweenRequestsMs);
    options.respectRobots = t.crawl.respectRobots;
    options.saveContent = t.crawl.saveContent;
    options.enableCredentialPrompting = t.crawl.enableCredentialPrompting;
    options.extractImages = t.behaviors.extractImages;
    if (!t.behaviors.retryFailedPages) {
        options.maxRetries = 0;
    }

    if (!t.urlPatterns.include.empty()) {
        options.includePatterns = t.urlPatterns.include;
    }
    if (!t.urlPatterns.exclude.empty()) {
        options.excludePatterns = t.urlPatterns.exclude;
    }
}

} // namespace templates
} // namespace crawler
} // namespace sitewatch
