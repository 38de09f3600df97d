#pragma once
#include "TemplateTypes.h"
#include <optional>
#include <string>
#include <vector>

namespace sitewatch {
namespace crawler {
namespace templates {

// Job template id that picks a template from the base URL at run time
inline constexpr const char* kAutoTemplateId = "auto";

// Read-only set of crawling profiles: the built-ins plus any templates loaded
// from disk at startup. Safe to share between threads once constructed.
class TemplateCatalog {
public:
    // Additional templates whose id collides with one already present are skipped.
    explicit TemplateCatalog(std::vector<WebsiteTemplate> additional = {});

    std::optional<WebsiteTemplate> getTemplateById(const std::string& id) const;

    // Total: unparseable URLs and URLs matching no rule get corporate-comprehensive.
    WebsiteTemplate suggestTemplateForUrl(const std::string& url) const;

    std::vector<WebsiteTemplate> listTemplates() const;
    std::vector<WebsiteTemplate> getTemplatesByCategory(TemplateCategory category) const;

    bool contains(const std::string& id) const;
    size_t size() const { return templates_.size(); }

private:
    std::vector<WebsiteTemplate> templates_;
};

// Builds an ad-hoc profile for sites none of the built-ins describe.
WebsiteTemplate createCustomTemplate(const std::string& name,
                                     int maxDepth,
                                     int maxPages,
                                     const std::vector<std::string>& includePatterns = {},
                                     const std::vector<std::string>& excludePatterns = {});

} // namespace templates
} // namespace crawler
} // namespace sitewatch
