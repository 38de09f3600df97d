#include "../../../include/sitewatch/crawler/templates/TemplateCatalog.h"
#include "../../../include/sitewatch/crawler/templates/PrebuiltTemplates.h"
#include "../../../include/sitewatch/common/Logger.h"
#include "../../../include/sitewatch/common/UrlUtils.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <initializer_list>

namespace sitewatch {
namespace crawler {
namespace templates {

namespace {

const char* const kFallbackTemplateId = "corporate-comprehensive";

bool containsAny(const std::string& haystack, std::initializer_list<const char*> needles) {
    for (const char* needle : needles) {
        if (haystack.find(needle) != std::string::npos) return true;
    }
    return false;
}

// Rule chain evaluated top to bottom; first match wins.
std::string suggestedIdFor(const std::string& host, const std::string& path) {
    if (containsAny(host, {"docs", "documentation"}) || containsAny(path, {"/docs/", "/documentation/"})) {
        return "documentation-deep";
    }
    if (containsAny(host, {"wiki", "wikipedia", "confluence"}) || containsAny(path, {"/wiki/"})) {
        return "wiki-knowledge";
    }
    if (containsAny(host, {"shop", "store", "amazon", "ebay", "etsy", "shopify"}) ||
        containsAny(path, {"/product/", "/catalog/"})) {
        return "ecommerce-catalog";
    }
    if (containsAny(host, {"news", "blog"}) || containsAny(path, {"/blog/", "/news/", "/article/", "/post/"})) {
        return "news-blog-aggressive";
    }
    if (containsAny(host, {"reddit", "forum", "community", "discord"}) ||
        containsAny(path, {"/forum/", "/community/"})) {
        return "social-platform";
    }
    return kFallbackTemplateId;
}

} // namespace

TemplateCatalog::TemplateCatalog(std::vector<WebsiteTemplate> additional)
    : templates_(prebuiltTemplates()) {
    for (auto& t : additional) {
        if (t.id.empty()) {
            LOG_WARNING("Skipping template without id: " + t.name);
            continue;
        }
        if (contains(t.id)) {
            LOG_WARNING("Skipping template with duplicate id: " + t.id);
            continue;
        }
        LOG_DEBUG("Registered template " + t.id);
        templates_.push_back(std::move(t));
    }
}

std::optional<WebsiteTemplate> TemplateCatalog::getTemplateById(const std::string& id) const {
    auto it = std::find_if(templates_.begin(), templates_.end(),
                           [&id](const WebsiteTemplate& t) { return t.id == id; });
    if (it == templates_.end()) return std::nullopt;
    return *it;
}

bool TemplateCatalog::contains(const std::string& id) const {
    return std::any_of(templates_.begin(), templates_.end(),
                       [&id](const WebsiteTemplate& t) { return t.id == id; });
}

WebsiteTemplate TemplateCatalog::suggestTemplateForUrl(const std::string& url) const {
    std::string id = kFallbackTemplateId;
    auto parsed = common::parseUrl(url);
    if (parsed) {
        std::string path = parsed->path;
        std::transform(path.begin(), path.end(), path.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        id = suggestedIdFor(parsed->host, path);
    } else {
        LOG_DEBUG("Cannot parse URL for template suggestion, using fallback: " + url);
    }

    auto found = getTemplateById(id);
    if (found) return *found;
    // The built-in fallback is always present.
    return *getTemplateById(kFallbackTemplateId);
}

std::vector<WebsiteTemplate> TemplateCatalog::listTemplates() const {
    return templates_;
}

std::vector<WebsiteTemplate> TemplateCatalog::getTemplatesByCategory(TemplateCategory category) const {
    std::vector<WebsiteTemplate> out;
    for (const auto& t : templates_) {
        if (t.category == category) out.push_back(t);
    }
    return out;
}

WebsiteTemplate createCustomTemplate(const std::string& name,
                                     int maxDepth,
                                     int maxPages,
                                     const std::vector<std::string>& includePatterns,
                                     const std::vector<std::string>& excludePatterns) {
    auto nowMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    WebsiteTemplate t;
    t.id = "custom-" + std::to_string(nowMs);
    t.name = name;
    t.description = "Custom template: " + name;
    t.category = TemplateCategory::CUSTOM;
    t.crawl = {maxDepth, maxPages, true, 30000, 1500, true, true, true};

    const std::vector<std::string> follow =
        includePatterns.empty() ? std::vector<std::string>{"*"} : includePatterns;
    t.selectors.contentPriority = {"main", "article", ".content", "#content", "body"};
    t.selectors.excludeElements = {"nav", "header", "footer", "script", "style"};
    t.selectors.linkPatterns = follow;
    t.selectors.titleSelectors = {"h1", ".title", "title"};
    t.selectors.descriptionSelectors = {"meta[name=\"description\"]", ".description"};
    t.urlPatterns.include = includePatterns;
    t.urlPatterns.exclude = excludePatterns;
    t.urlPatterns.followPatterns = follow;
    t.metadata = {true, true, true, true, true};
    t.behaviors = {true, 1500, true, true, true, true};
    return t;
}

} // namespace templates
} // namespace crawler
} // namespace sitewatch
