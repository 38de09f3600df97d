#pragma once

#include "CrawlRunner.h"
#include "../auth/AuthErrorAdvisor.h"
#include "../auth/AuthenticationAdapter.h"
#include "../common/ServiceConfig.h"
#include "../crawler/CrawlEngine.h"
#include "../crawler/models/CrawlOptions.h"
#include "../crawler/templates/TemplateCatalog.h"

#include <memory>
#include <optional>

namespace sitewatch::scheduler {

// The template a job crawls with: none without a template id, the catalog's
// suggestion for the base URL with "auto", otherwise the named template.
// Throws std::invalid_argument for a template id the catalog does not know.
std::optional<crawler::templates::WebsiteTemplate> resolveJobTemplate(const storage::CrawlJob& job,
                                                                      const crawler::templates::TemplateCatalog& catalog);

// Crawl options for a job: defaults from the service configuration, then the
// job's template, then the job's own limits and patterns, then its `options`
// JSON. Throws std::invalid_argument for a template id the catalog does not know.
crawler::CrawlOptions buildCrawlOptions(const storage::CrawlJob& job,
                                        const crawler::templates::TemplateCatalog& catalog,
                                        const common::ServiceConfig& config);

// Live runner: libcurl fetcher, one browsing context per run.
class HttpCrawlRunner : public CrawlRunner {
public:
    HttpCrawlRunner(common::ServiceConfig config,
                    std::shared_ptr<const crawler::templates::TemplateCatalog> catalog,
                    std::shared_ptr<const auth::AuthenticationAdapter> authentication,
                    std::shared_ptr<const auth::AuthErrorAdvisor> advisor);

    crawler::CrawlResult run(const storage::CrawlJob& job,
                             const std::optional<auth::AuthConfig>& credential,
                             const std::string& runId,
                             const common::CancellationToken& cancel) override;

private:
    common::ServiceConfig config_;
    std::shared_ptr<const crawler::templates::TemplateCatalog> catalog_;
    std::shared_ptr<const auth::AuthenticationAdapter> authentication_;
    crawler::CrawlEngine engine_;
};

} // namespace sitewatch::scheduler
