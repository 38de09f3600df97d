#pragma once

#include "models/ScrapedPage.h"
#include "templates/TemplateTypes.h"

#include <string>
#include <vector>

namespace sitewatch::crawler {

// Turns fetched HTML into a ScrapedPage: main content, title, metadata,
// links, images and headings, using the template's selectors when given.
class ContentExtractor {
public:
    ContentExtractor();

    // Never throws. Authentication fields and statusCode are left for the caller.
    ScrapedPage extract(const std::string& html,
                        const std::string& url,
                        int depth,
                        const std::string& parentUrl,
                        const templates::WebsiteTemplate* webTemplate,
                        bool extractImages = true) const;

    static const std::vector<std::string>& defaultExcludedElements();
    static const std::vector<std::string>& defaultContentPriority();

    // Whitespace-separated word count.
    static size_t countWords(const std::string& text);

    // ceil(words / 200) minutes.
    static int readingTimeMinutes(size_t wordCount);

private:
    size_t minContentLength_;
};

} // namespace sitewatch::crawler
