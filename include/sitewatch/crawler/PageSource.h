#pragma once

#include "models/FailureType.h"
#include "models/ScrapedPage.h"
#include "templates/TemplateTypes.h"
#include "../common/CancellationToken.h"

#include <optional>
#include <string>

namespace sitewatch::crawler {

struct ScrapeOutcome {
    bool success = false;
    ScrapedPage page;
    std::string errorMessage;
    int statusCode = 0;
    FailureType failureType = FailureType::UNKNOWN;
    std::optional<std::string> loginMethod;  // set for authentication failures
    bool formLoginAttempted = false;
};

// Fetch-and-extract step used by the traversal engine, one URL at a time.
class PageSource {
public:
    virtual ~PageSource() = default;

    // Never throws for per-page problems; they come back as a failed outcome.
    virtual ScrapeOutcome fetchAndExtract(const std::string& url,
                                          int depth,
                                          const std::string& parentUrl,
                                          const templates::WebsiteTemplate* webTemplate,
                                          const common::CancellationToken& cancel) = 0;

    // Body of <origin>/robots.txt, or std::nullopt when there is none.
    virtual std::optional<std::string> fetchRobotsTxt(const std::string& origin,
                                                      const common::CancellationToken& cancel) = 0;
};

} // namespace sitewatch::crawler
