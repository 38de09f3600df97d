#pragma once

#include "ContentExtractor.h"
#include "HttpSession.h"
#include "PageSource.h"
#include "models/CrawlOptions.h"
#include "../auth/AuthenticationAdapter.h"
#include "../auth/BrowsingContext.h"

#include <memory>

namespace sitewatch::crawler {

// PageSource over an HttpSession. Owns the run's browsing context, retries
// transient failures with backoff and gets past a login page with the run's
// form credential (at most once per run).
class PageScraper : public PageSource {
public:
    PageScraper(std::shared_ptr<HttpSession> session,
                auth::BrowsingContext context,
                std::shared_ptr<const auth::AuthenticationAdapter> authentication,
                CrawlOptions options);

    ScrapeOutcome fetchAndExtract(const std::string& url,
                                  int depth,
                                  const std::string& parentUrl,
                                  const templates::WebsiteTemplate* webTemplate,
                                  const common::CancellationToken& cancel) override;

    std::optional<std::string> fetchRobotsTxt(const std::string& origin,
                                              const common::CancellationToken& cancel) override;

    const auth::BrowsingContext& context() const { return context_; }

private:
    // GET with retries for TEMPORARY, RATE_LIMITED and UNKNOWN failures.
    PageFetchResult fetchWithRetry(const std::string& url, const common::CancellationToken& cancel);

    // Returns the page to extract, logging in first when `fetched` is a login
    // wall. Throws auth::AuthenticationError when the wall cannot be passed.
    PageFetchResult passLoginWall(const std::string& url,
                                  PageFetchResult fetched,
                                  ScrapeOutcome& outcome,
                                  const common::CancellationToken& cancel);

    static bool isHtmlContent(const std::string& contentType);

    std::shared_ptr<HttpSession> session_;
    auth::BrowsingContext context_;
    std::shared_ptr<const auth::AuthenticationAdapter> authentication_;
    CrawlOptions options_;
    ContentExtractor extractor_;
    bool formLoginAttempted_ = false;
};

} // namespace sitewatch::crawler
