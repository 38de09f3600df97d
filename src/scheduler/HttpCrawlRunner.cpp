#include "../../include/sitewatch/scheduler/HttpCrawlRunner.h"
#include "../../include/sitewatch/crawler/PageScraper.h"
#include "../../include/sitewatch/crawler/templates/TemplateApplier.h"
#include "../../include/sitewatch/common/Logger.h"
#include "../crawler/PageFetcher.h"

#include <stdexcept>

namespace sitewatch::scheduler {

namespace {

// Reads an integer option, ignoring values of the wrong type or below `minimum`.
bool readIntOption(const nlohmann::json& options, const char* key, int minimum, int& out) {
    auto it = options.find(key);
    if (it == options.end()) {
        return false;
    }
    if (!it->is_number_integer() || it->get<int>() < minimum) {
        LOG_WARNING(std::string("Ignoring job option '") + key + "': expected an integer >= " + std::to_string(minimum));
        return false;
    }
    out = it->get<int>();
    return true;
}

bool readBoolOption(const nlohmann::json& options, const char* key, bool& out) {
    auto it = options.find(key);
    if (it == options.end()) {
        return false;
    }
    if (!it->is_boolean()) {
        LOG_WARNING(std::string("Ignoring job option '") + key + "': expected a boolean");
        return false;
    }
    out = it->get<bool>();
    return true;
}

} // namespace

std::optional<crawler::templates::WebsiteTemplate> resolveJobTemplate(const storage::CrawlJob& job,
                                                                      const crawler::templates::TemplateCatalog& catalog) {
    if (!job.templateId) {
        return std::nullopt;
    }
    if (*job.templateId == crawler::templates::kAutoTemplateId) {
        auto suggested = catalog.suggestTemplateForUrl(job.baseUrl);
        LOG_DEBUG("Job " + job.id + " uses suggested template " + suggested.id);
        return suggested;
    }
    auto webTemplate = catalog.getTemplateById(*job.templateId);
    if (!webTemplate) {
        throw std::invalid_argument("Unknown template: " + *job.templateId);
    }
    return webTemplate;
}

crawler::CrawlOptions buildCrawlOptions(const storage::CrawlJob& job,
                                        const crawler::templates::TemplateCatalog& catalog,
                                        const common::ServiceConfig& config) {
    crawler::CrawlOptions options;
    options.userAgent = config.userAgent;

    if (auto webTemplate = resolveJobTemplate(job, catalog)) {
        crawler::templates::applyTemplateToOptions(*webTemplate, options);
    }

    options.maxDepth = job.maxDepth;
    options.maxPages = job.maxPages;
    if (!job.includePatterns.empty()) {
        options.includePatterns = job.includePatterns;
    }
    if (!job.excludePatterns.empty()) {
        options.excludePatterns = job.excludePatterns;
    }

    if (!job.options.is_object()) {
        return options;
    }
    const nlohmann::json& overrides = job.options;

    int value = 0;
    if (readIntOption(overrides, "timeout", 1, value)) {
        options.timeout = std::chrono::milliseconds(value);
    }
    if (readIntOption(overrides, "delayBetweenRequests", 0, value)) {
        options.delayBetweenRequests = std::chrono::milliseconds(value);
    }
    if (readIntOption(overrides, "maxRetries", 0, value)) {
        options.maxRetries = value;
    }
    readBoolOption(overrides, "waitForDynamic", options.waitForDynamic);
    readBoolOption(overrides, "respectRobots", options.respectRobots);
    readBoolOption(overrides, "enableCredentialPrompting", options.enableCredentialPrompting);

    auto userAgent = overrides.find("userAgent");
    if (userAgent != overrides.end()) {
        if (userAgent->is_string() && !userAgent->get<std::string>().empty()) {
            options.userAgent = userAgent->get<std::string>();
        } else {
            LOG_WARNING("Ignoring job option 'userAgent': expected a non-empty string");
        }
    }
    return options;
}

HttpCrawlRunner::HttpCrawlRunner(common::ServiceConfig config,
                                 std::shared_ptr<const crawler::templates::TemplateCatalog> catalog,
                                 std::shared_ptr<const auth::AuthenticationAdapter> authentication,
                                 std::shared_ptr<const auth::AuthErrorAdvisor> advisor)
    : config_(std::move(config)),
      catalog_(std::move(catalog)),
      authentication_(std::move(authentication)),
      engine_(std::move(advisor)) {
    if (!catalog_ || !authentication_) {
        throw std::invalid_argument("HttpCrawlRunner requires a template catalog and an authentication adapter");
    }
}

crawler::CrawlResult HttpCrawlRunner::run(const storage::CrawlJob& job,
                                          const std::optional<auth::AuthConfig>& credential,
                                          const std::string& runId,
                                          const common::CancellationToken& cancel) {
    crawler::CrawlRequest request;
    request.baseUrl = job.baseUrl;
    request.options = buildCrawlOptions(job, *catalog_, config_);
    request.sessionId = runId;
    request.webTemplate = resolveJobTemplate(job, *catalog_);

    auth::BrowsingContext context = authentication_->prepare(credential, job.baseUrl);
    request.authMethod = context.authMethod();
    request.unsupportedAuthReason = context.unsupportedReason();

    auto fetcher = std::make_shared<crawler::PageFetcher>(request.options.userAgent,
                                                          request.options.timeout,
                                                          request.options.maxRedirects);
    if (request.options.waitForDynamic && config_.browserlessUrl) {
        fetcher->setSpaRendering(true, *config_.browserlessUrl, config_.spaRenderingTimeout);
    }

    LOG_INFO_STREAM("Starting crawl for job " << job.id << " (run " << runId << ") at " << job.baseUrl
                    << " [depth " << request.options.maxDepth << ", pages " << request.options.maxPages
                    << ", auth " << crawler::authMethodName(request.authMethod) << "]");

    crawler::PageScraper scraper(fetcher, std::move(context), authentication_, request.options);
    return engine_.crawl(request, scraper, cancel);
}

} // namespace sitewatch::scheduler
