#include <catch2/catch_test_macros.hpp>
#include "../../include/sitewatch/crawler/ContentExtractor.h"
#include "../../include/sitewatch/common/Hashing.h"

#include <algorithm>
#include <string>
#include <vector>

using namespace sitewatch;
using namespace sitewatch::crawler;

namespace {

const char* kArticlePage = R"(<!DOCTYPE html>
<html lang="en">
<head>
  <title>  Release   Notes  </title>
  <meta name="description" content="What changed in version 2">
  <meta name="keywords" content="release, notes, release, changelog">
  <meta name="author" content="Docs Team">
  <meta property="article:published_time" content="2024-03-01T10:00:00Z">
  <meta property="article:modified_time" content="2024-03-02T08:30:00Z">
  <script>var tracking = "should not be extracted";</script>
</head>
<body>
  <nav><a href="/home">Home</a> navigation words</nav>
  <article>
    <h1>Version 2</h1>
    <p>Version two brings a faster indexer, a new scheduler and many smaller fixes that
       users asked for over the last release cycle. Upgrading is recommended.</p>
    <h2>Upgrade steps</h2>
    <p>Stop the service, install the package and start it again.</p>
    <a href="/docs/upgrade#steps">Upgrade guide</a>
    <a href="https://other.org/ref">Reference</a>
    <a href="#top">Top</a>
    <a href="javascript:void(0)">Noop</a>
    <a href="/docs/upgrade">Upgrade guide again</a>
    <img src="/img/diagram.png">
    <img data-src="lazy.png">
  </article>
  <footer>Footer text</footer>
</body>
</html>)";

} // namespace

TEST_CASE("ContentExtractor - Article page", "[ContentExtractor]") {
    ContentExtractor extractor;
    ScrapedPage page = extractor.extract(kArticlePage, "https://example.com/blog/v2", 2,
                                         "https://example.com/blog", nullptr);

    SECTION("Title is trimmed and collapsed") {
        REQUIRE(page.title == "Release Notes");
    }

    SECTION("Main content comes from the article and skips excluded elements") {
        REQUIRE(page.content.find("faster indexer") != std::string::npos);
        REQUIRE(page.content.find("navigation words") == std::string::npos);
        REQUIRE(page.content.find("Footer text") == std::string::npos);
        REQUIRE(page.content.find("tracking") == std::string::npos);
    }

    SECTION("Metadata") {
        const PageMetadata& meta = page.metadata;
        REQUIRE(meta.domain == "example.com");
        REQUIRE(meta.description == "What changed in version 2");
        REQUIRE(meta.keywords == std::vector<std::string>{"release", "notes", "changelog"});
        REQUIRE(meta.author == "Docs Team");
        REQUIRE(meta.publishedDate == "2024-03-01T10:00:00Z");
        REQUIRE(meta.modifiedDate == "2024-03-02T08:30:00Z");
        REQUIRE(meta.language == "en");
        REQUIRE(meta.depth == 2);
        REQUIRE(meta.parentUrl == "https://example.com/blog");
    }

    SECTION("Links are absolute, fragment free and unique") {
        const auto& links = page.metadata.links;
        REQUIRE(std::count(links.begin(), links.end(), "https://example.com/docs/upgrade") == 1);
        REQUIRE(std::find(links.begin(), links.end(), "https://other.org/ref") != links.end());
        REQUIRE(std::find(links.begin(), links.end(), "https://example.com/home") != links.end());
        for (const auto& link : links) {
            REQUIRE(link.find('#') == std::string::npos);
            REQUIRE(link.rfind("javascript:", 0) == std::string::npos);
        }
    }

    SECTION("Images include lazy-loaded sources") {
        const auto& images = page.metadata.images;
        REQUIRE(std::find(images.begin(), images.end(), "https://example.com/img/diagram.png") != images.end());
        REQUIRE(std::find(images.begin(), images.end(), "https://example.com/blog/lazy.png") != images.end());
    }

    SECTION("Headings keep their level") {
        const auto& headings = page.metadata.headings;
        REQUIRE(headings.size() == 2);
        REQUIRE(headings[0].level == 1);
        REQUIRE(headings[0].text == "Version 2");
        REQUIRE(headings[1].level == 2);
    }

    SECTION("Word count, reading time and hash follow the content") {
        REQUIRE(page.metadata.wordCount == ContentExtractor::countWords(page.content));
        REQUIRE(page.metadata.readingTimeMinutes == 1);
        REQUIRE(page.contentHash == common::sha256Hex(page.content));
    }
}

TEST_CASE("ContentExtractor - Links with unsafe characters", "[ContentExtractor]") {
    ContentExtractor extractor;
    ScrapedPage page = extractor.extract(
        "<html><body><p>Downloads</p>"
        "<a href=\"/docs/release notes.html\">Notes</a>"
        "<a href=\"/search?q=a b|c\">Search</a>"
        "<a href=\"/docs/already%20encoded\">Encoded</a>"
        "<a href=\"https://bad host.example/\">Broken</a>"
        "<img src=\"/img/team photo.png\">"
        "</body></html>",
        "https://example.com/", 0, "", nullptr);

    const auto& links = page.metadata.links;
    REQUIRE(links == std::vector<std::string>{"https://example.com/docs/release%20notes.html",
                                              "https://example.com/search?q=a%20b%7Cc",
                                              "https://example.com/docs/already%20encoded"});
    REQUIRE(page.metadata.images == std::vector<std::string>{"https://example.com/img/team%20photo.png"});
    for (const auto& link : links) {
        REQUIRE(link.find(' ') == std::string::npos);
    }
}

TEST_CASE("ContentExtractor - Title fallbacks", "[ContentExtractor]") {
    ContentExtractor extractor;

    SECTION("First h1 when there is no title element") {
        ScrapedPage page = extractor.extract("<html><body><h1>Heading Title</h1><p>x</p></body></html>",
                                             "https://example.com/", 0, "", nullptr);
        REQUIRE(page.title == "Heading Title");
    }

    SECTION("Untitled when nothing names the page") {
        ScrapedPage page = extractor.extract("<html><body><p>Just text</p></body></html>",
                                             "https://example.com/", 0, "", nullptr);
        REQUIRE(page.title == "Untitled");
        REQUIRE(page.content == "Just text");
    }

    SECTION("Template title selectors win over h1") {
        templates::WebsiteTemplate tmpl;
        tmpl.selectors.titleSelectors = {".page-name"};
        ScrapedPage page = extractor.extract(
            "<html><body><h1>Generic</h1><div class=\"page-name\">Specific</div></body></html>",
            "https://example.com/", 0, "", &tmpl);
        REQUIRE(page.title == "Specific");
    }
}

TEST_CASE("ContentExtractor - Template selectors", "[ContentExtractor]") {
    templates::WebsiteTemplate tmpl;
    tmpl.selectors.contentPriority = {".doc-body"};
    tmpl.selectors.excludeElements = {".edit-link"};

    const std::string body(150, 'w');
    const std::string html = "<html><body><div class=\"sidebar\">Sidebar</div><div class=\"doc-body\"><p>" +
                             body + "</p><span class=\"edit-link\">Edit this page</span></div></body></html>";

    ContentExtractor extractor;
    ScrapedPage page = extractor.extract(html, "https://example.com/docs", 0, "", &tmpl, false);

    REQUIRE(page.content == body);
    REQUIRE(page.metadata.images.empty());
}

TEST_CASE("ContentExtractor - Helpers", "[ContentExtractor]") {
    REQUIRE(ContentExtractor::countWords("") == 0);
    REQUIRE(ContentExtractor::countWords("  one two\nthree\t four ") == 4);
    REQUIRE(ContentExtractor::readingTimeMinutes(0) == 0);
    REQUIRE(ContentExtractor::readingTimeMinutes(1) == 1);
    REQUIRE(ContentExtractor::readingTimeMinutes(200) == 1);
    REQUIRE(ContentExtractor::readingTimeMinutes(201) == 2);
}
