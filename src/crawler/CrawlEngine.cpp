#include "../../include/sitewatch/crawler/CrawlEngine.h"
#include "../../include/sitewatch/crawler/CrawlLogger.h"
#include "../../include/sitewatch/crawler/UrlPatternSet.h"
#include "../../include/sitewatch/common/Logger.h"
#include "../../include/sitewatch/common/UrlUtils.h"
#include "CrawlFrontier.h"
#include "FailureClassifier.h"
#include "RobotsTxtParser.h"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace sitewatch::crawler {

namespace {

void finishSummary(CrawlResult& result, std::chrono::system_clock::time_point start) {
    CrawlSummary& summary = result.summary;
    summary.successfulPages = result.pages.size();
    summary.failedPages = result.errors.size();
    summary.totalPages = summary.successfulPages + summary.failedPages;
    summary.startTime = start;
    summary.endTime = std::chrono::system_clock::now();
    summary.duration = std::chrono::duration_cast<std::chrono::milliseconds>(summary.endTime - start);
    summary.authenticationAttempts.failed = static_cast<int>(
        std::count_if(result.errors.begin(), result.errors.end(),
                      [](const CrawlError& e) { return e.needsCredentials; }));
}

} // namespace

CrawlEngine::CrawlEngine(std::shared_ptr<const auth::AuthErrorAdvisor> advisor)
    : advisor_(std::move(advisor)) {
    if (!advisor_) {
        throw std::invalid_argument("CrawlEngine requires an error advisor");
    }
}

CrawlResult CrawlEngine::crawl(const CrawlRequest& request,
                               PageSource& source,
                               const common::CancellationToken& cancel) const {
    const auto start = std::chrono::system_clock::now();
    const CrawlOptions& options = request.options;
    const std::string& runId = request.sessionId;

    const std::string baseUrl = common::stripFragment(common::sanitizeUrl(request.baseUrl));
    if (!common::isHttpUrl(baseUrl)) {
        throw std::invalid_argument("Invalid base URL: " + request.baseUrl);
    }
    const UrlPatternSet includes(options.includePatterns);
    const UrlPatternSet excludes(options.excludePatterns);
    const templates::WebsiteTemplate* webTemplate = request.webTemplate ? &*request.webTemplate : nullptr;

    CrawlResult result;
    result.baseUrl = baseUrl;
    if (request.authMethod == AuthMethod::CREDENTIALS) {
        result.summary.authenticationAttempts.credentials = 1;
    } else if (request.authMethod == AuthMethod::SSO) {
        result.summary.authenticationAttempts.sso = 1;
    }

    LOG_INFO("Starting crawl of " + baseUrl + " (max depth " + std::to_string(options.maxDepth) +
             ", max pages " + std::to_string(options.maxPages) + ")");
    CrawlLogger::broadcastSessionLog(runId, "🚀 Starting crawl: " + baseUrl, "info");

    if (request.unsupportedAuthReason) {
        CrawlError error;
        error.url = baseUrl;
        error.error = *request.unsupportedAuthReason;
        error.failureType = FailureType::AUTHENTICATION;
        error.isAuthError = true;
        error.needsCredentials = true;
        error.loginMethod = "cookie";
        result.errors.push_back(std::move(error));
        LOG_WARNING("Crawl of " + baseUrl + " needs a manual credential: " + *request.unsupportedAuthReason);
        CrawlLogger::broadcastSessionLog(runId, "🔐 Manual credential required for " + baseUrl, "warning");
        finishSummary(result, start);
        return result;
    }

    if (request.authMethod == AuthMethod::NONE && advisor_->isInternalDomain(baseUrl)) {
        result.errors.push_back(advisor_->internalDomainError(baseUrl));
        LOG_WARNING("Internal domain " + common::extractHost(baseUrl) + " has no credential configured, skipping crawl");
        CrawlLogger::broadcastSessionLog(runId, "🔐 Internal domain requires authentication: " + baseUrl, "warning");
        finishSummary(result, start);
        return result;
    }

    CrawlFrontier frontier;
    frontier.addURL(baseUrl, 0);

    RobotsTxtParser robots;
    std::unordered_set<std::string> robotsOrigins;

    int processedCount = 0;
    while (!frontier.isEmpty() && processedCount < options.maxPages) {
        if (cancel.isCancelled()) {
            result.summary.cancelled = true;
            break;
        }

        auto entry = frontier.getNextURL();
        if (!entry) {
            break;
        }
        const std::string& url = entry->url;

        if (frontier.isVisited(url) || frontier.isFailed(url)) {
            continue;
        }
        if (entry->depth > options.maxDepth) {
            LOG_DEBUG("Skipping " + url + ": depth " + std::to_string(entry->depth) + " exceeds limit");
            continue;
        }
        if (!common::isSameHost(url, baseUrl)) {
            LOG_DEBUG("Skipping off-site URL: " + url);
            continue;
        }
        const bool isSeed = entry->depth == 0;
        if (!isSeed && !includes.empty() && !includes.matches(url)) {
            LOG_DEBUG("Skipping URL not matching include patterns: " + url);
            continue;
        }
        if (excludes.matches(url)) {
            LOG_DEBUG("Skipping URL matching exclude patterns: " + url);
            continue;
        }

        std::chrono::milliseconds delay = options.delayBetweenRequests;
        if (options.respectRobots) {
            auto parsed = common::parseUrl(url);
            if (parsed && robotsOrigins.insert(parsed->origin()).second) {
                auto robotsTxt = source.fetchRobotsTxt(parsed->origin(), cancel);
                robots.parseRobotsTxt(parsed->host, robotsTxt.value_or(""));
            }
            if (!robots.isAllowed(url, options.userAgent)) {
                LOG_INFO("URL disallowed by robots.txt, skipping: " + url);
                CrawlLogger::broadcastSessionLog(runId, "🚫 Disallowed by robots.txt: " + url, "info");
                continue;
            }
            if (parsed) {
                delay = std::max(delay, robots.getCrawlDelay(parsed->host, options.userAgent));
            }
        }

        // Rate limit between consecutive fetches
        if (processedCount > 0 && !cancel.waitFor(delay)) {
            result.summary.cancelled = true;
            break;
        }

        ++processedCount;
        CrawlLogger::broadcastSessionLog(runId, "🔍 Crawling [" + std::to_string(processedCount) + "/" +
                                         std::to_string(options.maxPages) + "] " + url +
                                         " (depth " + std::to_string(entry->depth) + ")", "info");

        ScrapeOutcome outcome = source.fetchAndExtract(url, entry->depth, entry->parentUrl, webTemplate, cancel);
        if (outcome.formLoginAttempted) {
            CrawlLogger::broadcastSessionLog(runId, "🔑 Form login performed while fetching " + url, "info");
        }

        if (!outcome.success && cancel.isCancelled()) {
            result.summary.cancelled = true;
            break;
        }

        if (outcome.success) {
            ScrapedPage page = std::move(outcome.page);
            if (page.metadata.contentType == "public" && advisor_->isInternalDomain(url)) {
                page.metadata.contentType = "internal";
            }
            frontier.markVisited(url);
            if (!page.finalUrl.empty()) {
                frontier.markVisited(page.finalUrl);
            }

            size_t queued = 0;
            if (entry->depth < options.maxDepth) {
                for (const auto& link : page.metadata.links) {
                    if (common::isSameHost(link, baseUrl) && frontier.addURL(link, entry->depth + 1, url)) {
                        ++queued;
                    }
                }
            }

            LOG_INFO("Page crawled: " + url + " (" + std::to_string(page.metadata.wordCount) + " words, " +
                     std::to_string(queued) + " new links)");
            CrawlLogger::broadcastSessionLog(runId, "✅ SUCCESS " + url + " - " + page.title, "info");
            result.pages.push_back(std::move(page));
        } else {
            const bool authFailure = outcome.failureType == FailureType::AUTHENTICATION;
            CrawlError error = advisor_->analyzeError(url, outcome.errorMessage,
                                                      options.enableCredentialPrompting, authFailure);
            error.depth = entry->depth;
            error.statusCode = outcome.statusCode;
            if (!error.isAuthError) {
                error.failureType = outcome.failureType;
            }
            if (outcome.loginMethod) {
                error.loginMethod = outcome.loginMethod;
            }
            frontier.markFailed(url);

            LOG_WARNING("Failed to crawl " + url + ": " + outcome.errorMessage + " [" +
                        FailureClassifier::getFailureTypeDescription(error.failureType) + "]");
            CrawlLogger::broadcastSessionLog(runId, "❌ FAILED " + url + " - " + outcome.errorMessage, "error");
            result.errors.push_back(std::move(error));
        }
    }

    if (processedCount >= options.maxPages && !frontier.isEmpty()) {
        LOG_INFO("Reached maximum pages limit (" + std::to_string(options.maxPages) + "), stopping crawl");
    }
    if (result.summary.cancelled) {
        LOG_WARNING("Crawl of " + baseUrl + " cancelled after " + std::to_string(processedCount) + " pages");
        CrawlLogger::broadcastSessionLog(runId, "⏹️ Crawl cancelled", "warning");
    }

    finishSummary(result, start);
    LOG_INFO("Crawl of " + baseUrl + " finished: " + std::to_string(result.summary.successfulPages) +
             " pages, " + std::to_string(result.summary.failedPages) + " errors in " +
             std::to_string(result.summary.duration.count()) + "ms");
    CrawlLogger::broadcastSessionLog(runId, "🏁 Crawl finished: " + std::to_string(result.summary.successfulPages) +
                                     " pages, " + std::to_string(result.summary.failedPages) + " errors", "info");
    return result;
}

} // namespace sitewatch::crawler
