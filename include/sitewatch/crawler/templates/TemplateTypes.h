#pragma once
#include <optional>
#include <string>
#include <vector>

namespace sitewatch {
namespace crawler {
namespace templates {

enum class TemplateCategory {
    DOCUMENTATION,
    ECOMMERCE,
    NEWS,
    CORPORATE,
    BLOG,
    WIKI,
    SOCIAL,
    CUSTOM
};

struct TemplateCrawlSettings {
    int maxDepth = 2;
    int maxPages = 100;
    bool waitForDynamic = false;
    int timeoutMs = 30000;
    int delayBetweenRequestsMs = 1000;
    bool respectRobots = true;
    bool saveContent = true;
    bool enableCredentialPrompting = true;
};

struct SelectorPatterns {
    std::vector<std::string> contentPriority;
    std::vector<std::string> excludeElements;
    std::vector<std::string> linkPatterns;
    std::vector<std::string> titleSelectors;
    std::vector<std::string> descriptionSelectors;
};

struct UrlPatterns {
    std::vector<std::string> include;
    std::vector<std::string> exclude;
    std::vector<std::string> followPatterns;
};

struct MetadataRules {
    bool detectArticles = true;
    bool extractAuthors = true;
    bool extractDates = true;
    bool extractCategories = true;
    bool extractTags = true;
};

struct TemplateBehaviors {
    bool respectRobots = true;
    int delayBetweenRequestsMs = 1000;
    bool retryFailedPages = true;
    bool skipDuplicateContent = true;
    bool extractImages = true;
    bool extractDownloads = true;
};

// Named crawling profile. Pure configuration: nothing mutates a template once
// it is in the catalog.
struct WebsiteTemplate {
    std::string id;
    std::string name;
    std::string description;
    TemplateCategory category = TemplateCategory::CUSTOM;
    TemplateCrawlSettings crawl;
    SelectorPatterns selectors;
    UrlPatterns urlPatterns;
    MetadataRules metadata;
    TemplateBehaviors behaviors;
};

std::string categoryToString(TemplateCategory category);
std::optional<TemplateCategory> categoryFromString(const std::string& name);

} // namespace templates
} // namespace crawler
} // namespace sitewatch
