#include <catch2/catch_test_macros.hpp>
#include "../../include/sitewatch/scheduler/HttpCrawlRunner.h"

#include <stdexcept>

using namespace sitewatch;
using sitewatch::scheduler::buildCrawlOptions;

namespace {

storage::CrawlJob makeJob() {
    storage::CrawlJob job;
    job.id = "job-1";
    job.tenantId = "tenant-1";
    job.baseUrl = "https://docs.example.com/";
    job.schedule = "0 * * * *";
    job.maxDepth = 3;
    job.maxPages = 40;
    return job;
}

common::ServiceConfig makeConfig() {
    common::ServiceConfig config;
    config.userAgent = "ConfiguredAgent/2.0";
    return config;
}

} // namespace

TEST_CASE("buildCrawlOptions - Defaults and job limits", "[CrawlOptions]") {
    crawler::templates::TemplateCatalog catalog;
    auto job = makeJob();

    auto options = buildCrawlOptions(job, catalog, makeConfig());
    REQUIRE(options.userAgent == "ConfiguredAgent/2.0");
    REQUIRE(options.maxDepth == 3);
    REQUIRE(options.maxPages == 40);
    REQUIRE(options.includePatterns.empty());
    REQUIRE(options.excludePatterns.empty());
    REQUIRE(options.timeout == std::chrono::milliseconds(30000));
    REQUIRE_FALSE(options.respectRobots);
}

TEST_CASE("buildCrawlOptions - Template then job", "[CrawlOptions]") {
    crawler::templates::TemplateCatalog catalog;
    auto job = makeJob();
    job.templateId = std::string("documentation-deep");

    SECTION("Template settings apply, job limits win") {
        auto options = buildCrawlOptions(job, catalog, makeConfig());
        REQUIRE(options.maxDepth == 3);
        REQUIRE(options.maxPages == 40);
        REQUIRE(options.waitForDynamic);
        REQUIRE(options.respectRobots);
        REQUIRE_FALSE(options.includePatterns.empty());
        REQUIRE(options.includePatterns.front() == "docs");
        REQUIRE_FALSE(options.excludePatterns.empty());
    }

    SECTION("Job patterns replace template patterns") {
        job.includePatterns = {"/reference/"};
        auto options = buildCrawlOptions(job, catalog, makeConfig());
        REQUIRE(options.includePatterns == std::vector<std::string>{"/reference/"});
        REQUIRE_FALSE(options.excludePatterns.empty());
    }

    SECTION("Unknown template") {
        job.templateId = std::string("no-such-template");
        REQUIRE_THROWS_AS(buildCrawlOptions(job, catalog, makeConfig()), std::invalid_argument);
    }
}

TEST_CASE("resolveJobTemplate - Suggested from the base URL", "[CrawlOptions]") {
    crawler::templates::TemplateCatalog catalog;
    auto job = makeJob();

    SECTION("No template id") {
        REQUIRE_FALSE(scheduler::resolveJobTemplate(job, catalog).has_value());
    }

    SECTION("Auto picks by host") {
        job.templateId = std::string("auto");
        auto resolved = scheduler::resolveJobTemplate(job, catalog);
        REQUIRE(resolved.has_value());
        REQUIRE(resolved->id == "documentation-deep");

        auto options = buildCrawlOptions(job, catalog, makeConfig());
        REQUIRE(options.waitForDynamic);
        REQUIRE(options.includePatterns.front() == "docs");
        REQUIRE(options.maxDepth == 3);
    }

    SECTION("Auto on a wiki and on an unknown site") {
        job.templateId = std::string("auto");
        job.baseUrl = "https://example.com/wiki/Main_Page";
        REQUIRE(scheduler::resolveJobTemplate(job, catalog)->id == "wiki-knowledge");
        job.baseUrl = "https://example.com/";
        REQUIRE(scheduler::resolveJobTemplate(job, catalog)->id == "corporate-comprehensive");
    }

    SECTION("Named template") {
        job.templateId = std::string("wiki-knowledge");
        REQUIRE(scheduler::resolveJobTemplate(job, catalog)->id == "wiki-knowledge");
        job.templateId = std::string("missing");
        REQUIRE_THROWS_AS(scheduler::resolveJobTemplate(job, catalog), std::invalid_argument);
    }
}

TEST_CASE("buildCrawlOptions - Job option overrides", "[CrawlOptions]") {
    crawler::templates::TemplateCatalog catalog;
    auto job = makeJob();

    SECTION("Well-typed overrides") {
        job.options = {{"timeout", 5000},
                       {"delayBetweenRequests", 0},
                       {"maxRetries", 4},
                       {"waitForDynamic", true},
                       {"respectRobots", true},
                       {"enableCredentialPrompting", false},
                       {"userAgent", "JobAgent/1.0"}};
        auto options = buildCrawlOptions(job, catalog, makeConfig());
        REQUIRE(options.timeout == std::chrono::milliseconds(5000));
        REQUIRE(options.delayBetweenRequests == std::chrono::milliseconds(0));
        REQUIRE(options.maxRetries == 4);
        REQUIRE(options.waitForDynamic);
        REQUIRE(options.respectRobots);
        REQUIRE_FALSE(options.enableCredentialPrompting);
        REQUIRE(options.userAgent == "JobAgent/1.0");
    }

    SECTION("Wrong types and out-of-range values are ignored") {
        job.options = {{"timeout", 0},
                       {"delayBetweenRequests", "fast"},
                       {"maxRetries", -1},
                       {"respectRobots", "yes"},
                       {"userAgent", ""}};
        auto options = buildCrawlOptions(job, catalog, makeConfig());
        REQUIRE(options.timeout == std::chrono::milliseconds(30000));
        REQUIRE(options.delayBetweenRequests == std::chrono::milliseconds(1000));
        REQUIRE(options.maxRetries == 2);
        REQUIRE_FALSE(options.respectRobots);
        REQUIRE(options.userAgent == "ConfiguredAgent/2.0");
    }

    SECTION("Non-object options are ignored") {
        job.options = nlohmann::json::array({1, 2});
        auto options = buildCrawlOptions(job, catalog, makeConfig());
        REQUIRE(options.maxDepth == 3);
        REQUIRE(options.userAgent == "ConfiguredAgent/2.0");
    }
}
