#include <catch2/catch_test_macros.hpp>
#include "../../include/sitewatch/crawler/templates/TemplateApplier.h"
#include "../../include/sitewatch/crawler/templates/TemplateCatalog.h"
#include "../../include/sitewatch/crawler/templates/TemplateStorage.h"
#include "../../include/sitewatch/crawler/templates/TemplateValidator.h"

#include <filesystem>
#include <fstream>

using namespace sitewatch::crawler;
using namespace sitewatch::crawler::templates;

namespace {

nlohmann::json minimalTemplate() {
    return {
        {"id", "release-notes"},
        {"name", "Release notes"},
        {"category", "documentation"},
        {"crawlOptions", {{"maxDepth", 3}, {"maxPages", 40}, {"timeout", 15000}}},
        {"urlPatterns", {{"include", {"/releases/"}}, {"exclude", {"\\.pdf$"}}}}
    };
}

} // namespace

TEST_CASE("TemplateValidator - accepts a well-formed template", "[templates]") {
    auto result = validateTemplateJson(minimalTemplate());
    REQUIRE(result.valid);
}

TEST_CASE("TemplateValidator - rejects malformed templates", "[templates]") {
    SECTION("Missing id") {
        auto body = minimalTemplate();
        body.erase("id");
        REQUIRE_FALSE(validateTemplateJson(body).valid);
    }

    SECTION("Upper-case id") {
        auto body = minimalTemplate();
        body["id"] = "Release-Notes";
        REQUIRE_FALSE(validateTemplateJson(body).valid);
    }

    SECTION("Unknown category") {
        auto body = minimalTemplate();
        body["category"] = "podcast";
        REQUIRE_FALSE(validateTemplateJson(body).valid);
    }

    SECTION("Out of range limits") {
        auto body = minimalTemplate();
        body["crawlOptions"]["maxPages"] = 0;
        auto result = validateTemplateJson(body);
        REQUIRE_FALSE(result.valid);
        REQUIRE(result.message.find("crawlOptions.maxPages") != std::string::npos);
    }

    SECTION("Selector arrays must hold strings") {
        auto body = minimalTemplate();
        body["selectors"] = {{"contentPriority", {1, 2}}};
        REQUIRE_FALSE(validateTemplateJson(body).valid);
    }

    SECTION("URL patterns must compile") {
        auto body = minimalTemplate();
        body["urlPatterns"]["include"] = {"(unclosed"};
        auto result = validateTemplateJson(body);
        REQUIRE_FALSE(result.valid);
        REQUIRE(result.message.find("urlPatterns.include") != std::string::npos);
    }
}

TEST_CASE("TemplateStorage - JSON keeps every section", "[templates]") {
    TemplateCatalog catalog;
    auto original = *catalog.getTemplateById("news-blog-aggressive");
    auto copy = fromJson(toJson(original));

    REQUIRE(copy.id == original.id);
    REQUIRE(copy.category == original.category);
    REQUIRE(copy.crawl.maxPages == original.crawl.maxPages);
    REQUIRE(copy.crawl.timeoutMs == original.crawl.timeoutMs);
    REQUIRE(copy.selectors.contentPriority == original.selectors.contentPriority);
    REQUIRE(copy.urlPatterns.exclude == original.urlPatterns.exclude);
    REQUIRE(copy.behaviors.retryFailedPages == original.behaviors.retryFailedPages);
    REQUIRE(validateTemplateJson(toJson(original)).valid);
}

TEST_CASE("TemplateStorage - loading from disk skips invalid entries", "[templates]") {
    auto dir = std::filesystem::temp_directory_path() / "sitewatch_template_tests";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    auto bad = minimalTemplate();
    bad["id"] = "";
    {
        std::ofstream out(dir / "a.json");
        out << nlohmann::json::array({minimalTemplate(), bad}).dump();
    }
    {
        std::ofstream out(dir / "b.json");
        out << "{ this is not json";
    }
    {
        std::ofstream out(dir / "ignored.txt");
        out << minimalTemplate().dump();
    }

    auto loaded = loadTemplates(dir.string());
    REQUIRE(loaded.size() == 1);
    REQUIRE(loaded[0].id == "release-notes");
    REQUIRE(loaded[0].crawl.maxDepth == 3);

    SECTION("A saved template loads back") {
        auto path = (dir / "saved.json").string();
        REQUIRE(saveTemplateToFile(loaded[0], path));
        auto reloaded = loadTemplates(path);
        REQUIRE(reloaded.size() == 1);
        REQUIRE(reloaded[0].urlPatterns.include == std::vector<std::string>{"/releases/"});
    }

    REQUIRE(loadTemplates((dir / "missing").string()).empty());
    std::filesystem::remove_all(dir);
}

TEST_CASE("TemplateApplier - template values land on crawl options", "[templates]") {
    WebsiteTemplate t;
    t.crawl.maxDepth = 5;
    t.crawl.maxPages = 900;
    t.crawl.timeoutMs = 12000;
    t.crawl.delayBetweenRequestsMs = 250;
    t.crawl.respectRobots = true;
    t.crawl.enableCredentialPrompting = false;
    t.behaviors.extractImages = false;
    t.behaviors.retryFailedPages = false;
    t.urlPatterns.include = {"/docs/"};

    CrawlOptions options;
    options.excludePatterns = {"/private/"};
    applyTemplateToOptions(t, options);

    REQUIRE(options.maxDepth == 5);
    REQUIRE(options.maxPages == 900);
    REQUIRE(options.timeout.count() == 12000);
    REQUIRE(options.delayBetweenRequests.count() == 250);
    REQUIRE(options.respectRobots);
    REQUIRE_FALSE(options.enableCredentialPrompting);
    REQUIRE_FALSE(options.extractImages);
    REQUIRE(options.maxRetries == 0);
    REQUIRE(options.includePatterns == std::vector<std::string>{"/docs/"});
    // Empty template patterns leave existing ones alone
    REQUIRE(options.excludePatterns == std::vector<std::string>{"/private/"});
}
