#include "../../include/sitewatch/crawler/ContentExtractor.h"
#include "../../include/sitewatch/crawler/html/HtmlDocument.h"
#include "../../include/sitewatch/common/Hashing.h"
#include "../../include/sitewatch/common/Logger.h"
#include "../../include/sitewatch/common/UrlUtils.h"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <sstream>
#include <unordered_set>

namespace sitewatch::crawler {

using html::HtmlDocument;
using html::NodeSet;

namespace {

bool insideExcluded(const GumboNode* node, const NodeSet& excluded) {
    for (const GumboNode* current = node; current != nullptr; current = current->parent) {
        if (excluded.count(current) > 0) return true;
    }
    return false;
}

std::string trimCopy(const std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// First non-empty attribute value among elements matched by the selectors, in order.
std::string firstAttribute(const HtmlDocument& doc, std::initializer_list<const char*> selectors, const char* attr) {
    for (const char* selector : selectors) {
        for (const GumboNode* node : doc.select(selector)) {
            auto value = html::attribute(node, attr);
            if (value) {
                std::string trimmed = trimCopy(*value);
                if (!trimmed.empty()) return trimmed;
            }
        }
    }
    return "";
}

std::string firstText(const HtmlDocument& doc, const std::vector<std::string>& selectors) {
    for (const auto& selector : selectors) {
        for (const GumboNode* node : doc.select(selector)) {
            std::string text = html::collapseWhitespace(html::textContent(node));
            if (!text.empty()) return text;
        }
    }
    return "";
}

// Text of the matched elements, skipping matches nested inside an earlier match.
std::string combinedText(const std::vector<const GumboNode*>& nodes, const NodeSet& excluded) {
    NodeSet taken;
    std::string text;
    for (const GumboNode* node : nodes) {
        if (insideExcluded(node, excluded) || insideExcluded(node, taken)) continue;
        taken.insert(node);
        text += html::textContent(node, &excluded);
        text += ' ';
    }
    return html::collapseWhitespace(text);
}

std::vector<std::string> splitKeywords(const std::string& raw) {
    std::vector<std::string> keywords;
    std::stringstream stream(raw);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = trimCopy(item);
        if (!item.empty() && std::find(keywords.begin(), keywords.end(), item) == keywords.end()) {
            keywords.push_back(item);
        }
    }
    return keywords;
}

// Percent-encodes characters that may not appear raw in a request line.
std::string encodeUnsafeCharacters(const std::string& url) {
    static const char* const kHex = "0123456789ABCDEF";
    std::string out;
    out.reserve(url.size());
    for (unsigned char c : url) {
        if (c == ' ' || c == '"' || c == '<' || c == '>' || c == '\\' ||
            c == '^' || c == '`' || c == '{' || c == '|' || c == '}') {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        } else {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

void addResolved(const std::string& baseUrl, const std::string& href,
                 std::vector<std::string>& out, std::unordered_set<std::string>& seen) {
    auto resolved = common::resolveUrl(baseUrl, href);
    if (!resolved || !common::isHttpUrl(*resolved)) return;
    std::string url = encodeUnsafeCharacters(common::stripFragment(*resolved));
    if (seen.insert(url).second) {
        out.push_back(std::move(url));
    }
}

} // namespace

ContentExtractor::ContentExtractor() : minContentLength_(100) {}

const std::vector<std::string>& ContentExtractor::defaultExcludedElements() {
    static const std::vector<std::string> elements = {
        "script", "style", "noscript", "nav", "header", "footer", "aside",
        ".nav", ".navigation", ".menu", ".advertisement", ".ads", ".cookie-banner"
    };
    return elements;
}

const std::vector<std::string>& ContentExtractor::defaultContentPriority() {
    static const std::vector<std::string> selectors = {
        "article", "main", ".content", ".post-content", ".entry-content",
        ".article-content", "#content", "#main-content", ".main-content"
    };
    return selectors;
}

size_t ContentExtractor::countWords(const std::string& text) {
    std::istringstream stream(text);
    std::string word;
    size_t count = 0;
    while (stream >> word) ++count;
    return count;
}

int ContentExtractor::readingTimeMinutes(size_t wordCount) {
    return static_cast<int>((wordCount + 199) / 200);
}

ScrapedPage ContentExtractor::extract(const std::string& htmlText,
                                      const std::string& url,
                                      int depth,
                                      const std::string& parentUrl,
                                      const templates::WebsiteTemplate* webTemplate,
                                      bool extractImages) const {
    ScrapedPage page;
    page.url = url;
    page.finalUrl = url;
    page.scrapedAt = std::chrono::system_clock::now();
    page.metadata.domain = common::extractHost(url);
    page.metadata.depth = depth;
    page.metadata.parentUrl = parentUrl;

    HtmlDocument doc(htmlText);
    if (!doc.root()) {
        LOG_WARNING("HTML parser produced no document for: " + url);
        page.title = "Untitled";
        page.contentHash = common::sha256Hex(page.content);
        return page;
    }

    // Excluded subtrees
    NodeSet excluded;
    std::vector<std::string> exclusions = defaultExcludedElements();
    if (webTemplate) {
        exclusions.insert(exclusions.end(),
                          webTemplate->selectors.excludeElements.begin(),
                          webTemplate->selectors.excludeElements.end());
    }
    for (const auto& selector : exclusions) {
        for (const GumboNode* node : doc.select(selector)) {
            excluded.insert(node);
        }
    }

    // Main content
    const std::vector<std::string>& priority =
        (webTemplate && !webTemplate->selectors.contentPriority.empty())
            ? webTemplate->selectors.contentPriority
            : defaultContentPriority();
    for (const auto& selector : priority) {
        std::string text = combinedText(doc.select(selector), excluded);
        if (text.size() > minContentLength_) {
            LOG_DEBUG("Content selector '" + selector + "' matched for: " + url);
            page.content = std::move(text);
            break;
        }
    }
    if (page.content.empty()) {
        const GumboNode* body = doc.findFirst(GUMBO_TAG_BODY);
        page.content = html::collapseWhitespace(html::textContent(body ? body : doc.root(), &excluded));
    }

    // Title
    page.title = firstText(doc, {"title"});
    if (page.title.empty() && webTemplate) {
        page.title = firstText(doc, webTemplate->selectors.titleSelectors);
    }
    if (page.title.empty()) {
        page.title = firstText(doc, {"h1"});
    }
    if (page.title.empty()) {
        page.title = "Untitled";
    }

    PageMetadata& meta = page.metadata;
    meta.description = firstAttribute(doc, {
        "meta[name=\"description\" i]",
        "meta[property=\"og:description\"]",
        "meta[name=\"twitter:description\"]",
        "meta[property=\"article:description\"]"
    }, "content");
    if (meta.description.empty() && webTemplate) {
        meta.description = firstText(doc, webTemplate->selectors.descriptionSelectors);
    }

    meta.keywords = splitKeywords(firstAttribute(doc, {
        "meta[name=\"keywords\" i]",
        "meta[property=\"article:tag\"]"
    }, "content"));

    meta.author = firstAttribute(doc, {
        "meta[name=\"author\" i]",
        "meta[property=\"article:author\"]",
        "meta[name=\"twitter:creator\"]"
    }, "content");
    if (meta.author.empty()) {
        meta.author = firstText(doc, {"[rel=\"author\"]"});
    }

    meta.publishedDate = firstAttribute(doc, {
        "meta[property=\"article:published_time\"]",
        "meta[name=\"date\" i]"
    }, "content");
    if (meta.publishedDate.empty()) {
        meta.publishedDate = firstAttribute(doc, {"time[datetime]"}, "datetime");
    }
    if (meta.publishedDate.empty()) {
        meta.publishedDate = firstAttribute(doc, {"meta[property=\"og:updated_time\"]"}, "content");
    }

    meta.modifiedDate = firstAttribute(doc, {
        "meta[property=\"article:modified_time\"]",
        "meta[property=\"og:updated_time\"]"
    }, "content");

    meta.language = firstAttribute(doc, {"html[lang]"}, "lang");
    if (meta.language.empty()) {
        meta.language = firstAttribute(doc, {
            "meta[http-equiv=\"content-language\" i]",
            "meta[name=\"language\" i]"
        }, "content");
    }

    // Links and images are resolved against the URL actually served
    std::unordered_set<std::string> seenLinks;
    for (const GumboNode* node : doc.select("a[href]")) {
        std::string href = trimCopy(html::attribute(node, "href").value_or(""));
        if (href.empty() || href[0] == '#') continue;
        std::string lower = href.substr(0, 11);
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower.rfind("javascript:", 0) == 0) continue;
        addResolved(url, href, meta.links, seenLinks);
    }

    if (extractImages) {
        std::unordered_set<std::string> seenImages;
        for (const GumboNode* node : doc.select("img[src], img[data-src], img[data-lazy-src]")) {
            std::string src;
            for (const char* attr : {"src", "data-src", "data-lazy-src"}) {
                src = trimCopy(html::attribute(node, attr).value_or(""));
                if (!src.empty()) break;
            }
            if (!src.empty()) {
                addResolved(url, src, meta.images, seenImages);
            }
        }
    }

    for (const GumboNode* node : doc.select("h1, h2, h3, h4, h5, h6")) {
        std::string text = html::collapseWhitespace(html::textContent(node));
        if (text.empty()) continue;
        std::string tag = html::tagName(node);
        meta.headings.push_back({tag[1] - '0', std::move(text)});
    }

    meta.wordCount = countWords(page.content);
    meta.readingTimeMinutes = readingTimeMinutes(meta.wordCount);
    page.contentHash = common::sha256Hex(page.content);

    LOG_DEBUG_STREAM("Extracted " << url << ": " << page.content.size() << " chars, "
                     << meta.links.size() << " links, " << meta.images.size() << " images");
    return page;
}

} // namespace sitewatch::crawler
