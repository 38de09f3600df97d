#include <catch2/catch_test_macros.hpp>
#include "../../include/sitewatch/crawler/templates/TemplateCatalog.h"

#include <set>

using namespace sitewatch::crawler::templates;

TEST_CASE("TemplateCatalog - Built-in templates", "[templates]") {
    TemplateCatalog catalog;

    SECTION("All seven built-ins are present") {
        REQUIRE(catalog.size() == 7);
        for (const char* id : {"documentation-deep", "corporate-comprehensive", "news-blog-aggressive",
                               "ecommerce-catalog", "wiki-knowledge", "social-platform", "custom-aggressive"}) {
            INFO(id);
            REQUIRE(catalog.contains(id));
        }
    }

    SECTION("Lookup by id") {
        auto docs = catalog.getTemplateById("documentation-deep");
        REQUIRE(docs.has_value());
        REQUIRE(docs->category == TemplateCategory::DOCUMENTATION);
        REQUIRE_FALSE(docs->selectors.contentPriority.empty());
        REQUIRE_FALSE(catalog.getTemplateById("does-not-exist").has_value());
    }

    SECTION("Filter by category") {
        auto news = catalog.getTemplatesByCategory(TemplateCategory::NEWS);
        REQUIRE(news.size() == 1);
        REQUIRE(news[0].id == "news-blog-aggressive");
        REQUIRE(catalog.getTemplatesByCategory(TemplateCategory::BLOG).empty());
    }

    SECTION("Ids are unique") {
        std::set<std::string> ids;
        for (const auto& t : catalog.listTemplates()) ids.insert(t.id);
        REQUIRE(ids.size() == catalog.size());
    }
}

TEST_CASE("TemplateCatalog - URL suggestion", "[templates]") {
    TemplateCatalog catalog;

    REQUIRE(catalog.suggestTemplateForUrl("https://docs.python.org/3/").id == "documentation-deep");
    REQUIRE(catalog.suggestTemplateForUrl("https://example.com/docs/setup").id == "documentation-deep");
    REQUIRE(catalog.suggestTemplateForUrl("https://en.wikipedia.org/wiki/Cron").id == "wiki-knowledge");
    REQUIRE(catalog.suggestTemplateForUrl("https://shop.example.com/").id == "ecommerce-catalog");
    REQUIRE(catalog.suggestTemplateForUrl("https://example.com/blog/2024/post").id == "news-blog-aggressive");
    REQUIRE(catalog.suggestTemplateForUrl("https://community.example.com/").id == "social-platform");

    SECTION("Falls back to the corporate profile") {
        REQUIRE(catalog.suggestTemplateForUrl("https://acme.com/about").id == "corporate-comprehensive");
        REQUIRE(catalog.suggestTemplateForUrl("not a url").id == "corporate-comprehensive");
    }
}

TEST_CASE("TemplateCatalog - Additional templates", "[templates]") {
    WebsiteTemplate extra;
    extra.id = "intranet-handbook";
    extra.name = "Intranet handbook";
    extra.category = TemplateCategory::CORPORATE;

    WebsiteTemplate clash;
    clash.id = "wiki-knowledge";
    clash.name = "Shadowing wiki";

    TemplateCatalog catalog({extra, clash});

    REQUIRE(catalog.size() == 8);
    REQUIRE(catalog.contains("intranet-handbook"));
    // The built-in keeps its place
    REQUIRE(catalog.getTemplateById("wiki-knowledge")->name != "Shadowing wiki");
    REQUIRE(catalog.getTemplatesByCategory(TemplateCategory::CORPORATE).size() == 2);
}

TEST_CASE("TemplateCatalog - Custom templates", "[templates]") {
    auto custom = createCustomTemplate("Partner portal", 4, 250, {"/partners/"}, {"/partners/archive"});

    REQUIRE(custom.id.rfind("custom-", 0) == 0);
    REQUIRE(custom.category == TemplateCategory::CUSTOM);
    REQUIRE(custom.crawl.maxDepth == 4);
    REQUIRE(custom.crawl.maxPages == 250);
    REQUIRE(custom.urlPatterns.include == std::vector<std::string>{"/partners/"});
    REQUIRE(custom.urlPatterns.exclude == std::vector<std::string>{"/partners/archive"});

    SECTION("Without include patterns everything is followed") {
        auto open = createCustomTemplate("Open", 1, 10);
        REQUIRE(open.urlPatterns.followPatterns == std::vector<std::string>{"*"});
    }
}
