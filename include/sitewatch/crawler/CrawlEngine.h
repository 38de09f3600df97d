#pragma once

#include "PageSource.h"
#include "models/CrawlOptions.h"
#include "models/CrawlResult.h"
#include "templates/TemplateTypes.h"
#include "../auth/AuthErrorAdvisor.h"
#include "../common/CancellationToken.h"

#include <memory>
#include <optional>
#include <string>

namespace sitewatch::crawler {

struct CrawlRequest {
    std::string baseUrl;
    CrawlOptions options;
    std::optional<templates::WebsiteTemplate> webTemplate;
    // How the run's browsing context authenticates; NONE means no credential
    AuthMethod authMethod = AuthMethod::NONE;
    // Set when the credential cannot be used from the server (SSO)
    std::optional<std::string> unsupportedAuthReason;
    // Run id used for progress broadcasts
    std::string sessionId;
};

// Breadth-first traversal of one site within depth, page and pattern limits.
// Pages are fetched one at a time, in discovery order, through a PageSource.
class CrawlEngine {
public:
    explicit CrawlEngine(std::shared_ptr<const auth::AuthErrorAdvisor> advisor);

    // Per-page failures end up in CrawlResult::errors and never stop the run.
    // Throws std::invalid_argument for an unusable base URL or a malformed
    // include/exclude pattern.
    CrawlResult crawl(const CrawlRequest& request,
                      PageSource& source,
                      const common::CancellationToken& cancel) const;

private:
    std::shared_ptr<const auth::AuthErrorAdvisor> advisor_;
};

} // namespace sitewatch::crawler
