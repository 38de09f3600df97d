#include "../../../include/sitewatch/crawler/templates/PrebuiltTemplates.h"

#include <algorithm>
#include <cctype>

namespace sitewatch {
namespace crawler {
namespace templates {

std::string categoryToString(TemplateCategory category) {
    switch (category) {
        case TemplateCategory::DOCUMENTATION: return "documentation";
        case TemplateCategory::ECOMMERCE: return "ecommerce";
        case TemplateCategory::NEWS: return "news";
        case TemplateCategory::CORPORATE: return "corporate";
        case TemplateCategory::BLOG: return "blog";
        case TemplateCategory::WIKI: return "wiki";
        case TemplateCategory::SOCIAL: return "social";
        case TemplateCategory::CUSTOM: return "custom";
    }
    return "custom";
}

std::optional<TemplateCategory> categoryFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "documentation") return TemplateCategory::DOCUMENTATION;
    if (lower == "ecommerce") return TemplateCategory::ECOMMERCE;
    if (lower == "news") return TemplateCategory::NEWS;
    if (lower == "corporate") return TemplateCategory::CORPORATE;
    if (lower == "blog") return TemplateCategory::BLOG;
    if (lower == "wiki") return TemplateCategory::WIKI;
    if (lower == "social") return TemplateCategory::SOCIAL;
    if (lower == "custom") return TemplateCategory::CUSTOM;
    return std::nullopt;
}

namespace {

// Wraps a bare path keyword list into "*/<keyword>/*" follow patterns.
std::vector<std::string> followPatternsFor(const std::vector<std::string>& keywords) {
    std::vector<std::string> out;
    out.reserve(keywords.size());
    for (const auto& k : keywords) {
        out.push_back("*/" + k + "/*");
    }
    return out;
}

WebsiteTemplate documentationDeep() {
    WebsiteTemplate t;
    t.id = "documentation-deep";
    t.name = "Documentation Deep Dive";
    t.description = "Comprehensive scraping for documentation sites, APIs, guides, and technical content";
    t.category = TemplateCategory::DOCUMENTATION;
    t.crawl = {5, 100, true, 30000, 1000, true, true, true};
    t.selectors.contentPriority = {"main", "article", ".content", ".documentation", ".docs-content",
                                   ".guide-content", ".api-docs", ".markdown-body", "#content", ".post-content"};
    t.selectors.excludeElements = {"nav", "header", "footer", ".sidebar", ".navigation", ".breadcrumb",
                                   ".table-of-contents", ".search", ".comments", ".social-share"};
    t.selectors.linkPatterns = {"/docs/", "/documentation/", "/guide/", "/api/", "/reference/",
                                "/tutorial/", "/help/", "/manual/", "/wiki/"};
    t.selectors.titleSelectors = {"h1", ".page-title", ".doc-title", "title"};
    t.selectors.descriptionSelectors = {"meta[name=\"description\"]", ".description", ".summary", ".lead"};
    t.urlPatterns.include = {"docs", "documentation", "guide", "api", "reference", "tutorial", "help", "manual", "wiki"};
    t.urlPatterns.exclude = {"login", "register", "admin", "dashboard", "profile", "settings"};
    t.urlPatterns.followPatterns = followPatternsFor({"docs", "documentation", "guide", "api", "reference",
                                                      "tutorial", "help", "manual", "wiki"});
    t.metadata = {true, true, true, true, true};
    t.behaviors = {true, 1000, true, true, true, true};
    return t;
}

WebsiteTemplate corporateComprehensive() {
    WebsiteTemplate t;
    t.id = "corporate-comprehensive";
    t.name = "Corporate Site Complete";
    t.description = "Full corporate website analysis including products, services, news, and resources";
    t.category = TemplateCategory::CORPORATE;
    t.crawl = {4, 150, true, 45000, 2000, true, true, true};
    t.selectors.contentPriority = {"main", "article", ".content", ".page-content", ".main-content", ".hero-content",
                                   ".product-info", ".service-description", ".news-content", "#content"};
    t.selectors.excludeElements = {"nav", "header", "footer", ".cookie-banner", ".chat-widget", ".social-media",
                                   ".advertisement", ".popup", ".modal"};
    t.selectors.linkPatterns = {"/products/", "/services/", "/solutions/", "/about/", "/news/", "/press/",
                                "/resources/", "/support/", "/contact/", "/careers/"};
    t.selectors.titleSelectors = {"h1", ".page-title", ".hero-title", "title"};
    t.selectors.descriptionSelectors = {"meta[name=\"description\"]", ".page-description", ".hero-description", ".summary"};
    t.urlPatterns.include = {"products", "services", "solutions", "about", "news", "press", "resources", "support", "careers"};
    t.urlPatterns.exclude = {"login", "register", "admin", "checkout", "cart", "account"};
    t.urlPatterns.followPatterns = followPatternsFor(t.urlPatterns.include);
    t.metadata = {true, true, true, true, false};
    t.behaviors = {true, 2000, true, true, true, true};
    return t;
}

WebsiteTemplate newsBlogAggressive() {
    WebsiteTemplate t;
    t.id = "news-blog-aggressive";
    t.name = "News & Blog Aggressive";
    t.description = "Comprehensive news site and blog scraping with article extraction";
    t.category = TemplateCategory::NEWS;
    t.crawl = {3, 200, true, 20000, 800, true, true, false};
    t.selectors.contentPriority = {"article", ".article-content", ".post-content", ".entry-content",
                                   ".news-content", ".blog-content", "main", ".content"};
    t.selectors.excludeElements = {"nav", "header", "footer", ".sidebar", ".comments", ".social-share",
                                   ".related-articles", ".advertisement", ".newsletter-signup"};
    t.selectors.linkPatterns = {"/article/", "/post/", "/news/", "/blog/", "/story/", "/category/", "/tag/", "/archive/"};
    t.selectors.titleSelectors = {"h1", ".article-title", ".post-title", ".headline"};
    t.selectors.descriptionSelectors = {"meta[name=\"description\"]", ".article-summary", ".excerpt", ".lead"};
    t.urlPatterns.include = {"article", "post", "news", "blog", "story", "category", "tag"};
    t.urlPatterns.exclude = {"login", "register", "subscribe", "newsletter", "admin"};
    t.urlPatterns.followPatterns = followPatternsFor(t.urlPatterns.include);
    t.metadata = {true, true, true, true, true};
    t.behaviors = {true, 800, true, true, true, false};
    return t;
}

WebsiteTemplate ecommerceCatalog() {
    WebsiteTemplate t;
    t.id = "ecommerce-catalog";
    t.name = "E-commerce Catalog";
    t.description = "Product catalog scraping with pricing, descriptions, and specifications";
    t.category = TemplateCategory::ECOMMERCE;
    t.crawl = {4, 300, true, 30000, 1500, true, true, false};
    t.selectors.contentPriority = {".product-content", ".product-description", ".product-details",
                                   ".item-description", "main", ".content", ".catalog-content"};
    t.selectors.excludeElements = {"nav", "header", "footer", ".cart", ".checkout", ".reviews",
                                   ".recommendations", ".social-share", ".advertisement"};
    t.selectors.linkPatterns = {"/product/", "/item/", "/catalog/", "/category/", "/shop/", "/store/", "/collection/"};
    t.selectors.titleSelectors = {"h1", ".product-title", ".item-title", ".product-name"};
    t.selectors.descriptionSelectors = {"meta[name=\"description\"]", ".product-description", ".product-summary", ".item-description"};
    t.urlPatterns.include = {"product", "item", "catalog", "category", "shop", "store", "collection"};
    t.urlPatterns.exclude = {"cart", "checkout", "payment", "account", "login", "register"};
    t.urlPatterns.followPatterns = followPatternsFor(t.urlPatterns.include);
    t.metadata = {false, false, false, true, true};
    t.behaviors = {true, 1500, true, true, true, false};
    return t;
}

WebsiteTemplate wikiKnowledge() {
    WebsiteTemplate t;
    t.id = "wiki-knowledge";
    t.name = "Wiki Knowledge Base";
    t.description = "Comprehensive wiki and knowledge base scraping with cross-references";
    t.category = TemplateCategory::WIKI;
    t.crawl = {6, 500, false, 25000, 500, true, true, true};
    t.selectors.contentPriority = {".mw-content-text", ".wiki-content", "#content", "main", "article",
                                   ".page-content", ".entry-content"};
    t.selectors.excludeElements = {"nav", "header", "footer", ".sidebar", ".navigation", ".toc",
                                   ".references", ".infobox", ".navbox"};
    t.selectors.linkPatterns = {"/wiki/", "/page/", "/article/", "/entry/", "/topic/", "/category/", "/namespace/"};
    t.selectors.titleSelectors = {"h1", ".firstHeading", ".page-title", "title"};
    t.selectors.descriptionSelectors = {"meta[name=\"description\"]", ".page-summary", ".description"};
    t.urlPatterns.include = {"wiki", "page", "article", "entry", "topic", "category"};
    t.urlPatterns.exclude = {"talk", "user", "special", "help", "template"};
    t.urlPatterns.followPatterns = followPatternsFor(t.urlPatterns.include);
    t.metadata = {true, true, true, true, true};
    t.behaviors = {true, 500, true, true, true, true};
    return t;
}

WebsiteTemplate socialPlatform() {
    WebsiteTemplate t;
    t.id = "social-platform";
    t.name = "Social Platform";
    t.description = "Social media and community platform scraping (public content only)";
    t.category = TemplateCategory::SOCIAL;
    t.crawl = {3, 100, true, 15000, 2000, true, true, true};
    t.selectors.contentPriority = {".post-content", ".message-content", ".comment-content", ".status-content",
                                   "main", ".content", "article"};
    t.selectors.excludeElements = {"nav", "header", "footer", ".sidebar", ".advertisement",
                                   ".suggested-content", ".social-actions", ".share-buttons"};
    t.selectors.linkPatterns = {"/post/", "/status/", "/profile/", "/user/", "/topic/", "/discussion/", "/thread/"};
    t.selectors.titleSelectors = {"h1", ".post-title", ".status-title", "title"};
    t.selectors.descriptionSelectors = {"meta[name=\"description\"]", ".post-summary", ".description"};
    t.urlPatterns.include = {"post", "status", "profile", "user", "topic", "discussion", "thread"};
    t.urlPatterns.exclude = {"login", "register", "settings", "private", "admin"};
    t.urlPatterns.followPatterns = followPatternsFor(t.urlPatterns.include);
    t.metadata = {true, true, true, false, true};
    t.behaviors = {true, 2000, false, true, false, false};
    return t;
}

WebsiteTemplate customAggressive() {
    WebsiteTemplate t;
    t.id = "custom-aggressive";
    t.name = "Custom Aggressive";
    t.description = "Maximum depth scraping for unknown sites - use with caution";
    t.category = TemplateCategory::CUSTOM;
    t.crawl = {8, 1000, true, 60000, 3000, false, true, true};
    t.selectors.contentPriority = {"main", "article", ".content", ".main-content", ".page-content", "#content",
                                   ".entry-content", ".post-content", "body"};
    t.selectors.excludeElements = {"nav", "header", "footer", "script", "style", ".advertisement", ".popup",
                                   ".modal", ".cookie-banner"};
    t.selectors.linkPatterns = {"*"};
    t.selectors.titleSelectors = {"h1", ".title", ".page-title", "title"};
    t.selectors.descriptionSelectors = {"meta[name=\"description\"]", ".description", ".summary"};
    t.urlPatterns.include = {"*"};
    // Literal prefixes escaped so they stay valid regular expressions
    t.urlPatterns.exclude = {"^javascript:", "^mailto:", "^tel:", "#", "^data:"};
    t.urlPatterns.followPatterns = {"*"};
    t.metadata = {true, true, true, true, true};
    t.behaviors = {false, 3000, true, true, true, true};
    return t;
}

} // namespace

const std::vector<WebsiteTemplate>& prebuiltTemplates() {
    static const std::vector<WebsiteTemplate> templates = {
        documentationDeep(),
        corporateComprehensive(),
        newsBlogAggressive(),
        ecommerceCatalog(),
        wikiKnowledge(),
        socialPlatform(),
        customAggressive(),
    };
    return templates;
}

} // namespace templates
} // namespace crawler
} // namespace sitewatch
