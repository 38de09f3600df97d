#include <catch2/catch_test_macros.hpp>
#include "../support/FakeHttpSession.h"
#include "../support/FakeLoginDetector.h"
#include "../../include/sitewatch/crawler/PageScraper.h"

#include <algorithm>

using namespace sitewatch;
using namespace sitewatch::crawler;
using sitewatch::testing::FakeHttpSession;
using sitewatch::testing::FakeLoginDetector;
using sitewatch::testing::FakeResponse;

namespace {

const char* kLoginWall = R"(<html><head><title>Sign in</title></head><body>
<p>LOGIN-WALL</p>
<form id="login" action="/session" method="post">
  <input type="hidden" name="csrf" value="tok123">
  <input type="text" name="username">
  <input type="password" name="password">
  <button type="submit" name="commit" value="Sign in">Sign in</button>
</form></body></html>)";

const char* kMembersPage = R"(<html><head><title>Members</title></head><body>
<h1>Member area</h1><p>Quarterly numbers for members only.</p>
<a href="/members/list">Member list</a></body></html>)";

CrawlOptions testOptions() {
    CrawlOptions options;
    options.maxRetries = 2;
    options.baseRetryDelay = std::chrono::milliseconds(1);
    options.maxRetryDelay = std::chrono::milliseconds(5);
    options.rateLimitDelay = std::chrono::milliseconds(1);
    return options;
}

std::shared_ptr<const auth::AuthenticationAdapter> makeAdapter() {
    return std::make_shared<const auth::AuthenticationAdapter>(std::make_shared<const FakeLoginDetector>());
}

bool hasField(const FormFields& fields, const std::string& name, const std::string& value) {
    return std::find(fields.begin(), fields.end(), std::make_pair(name, value)) != fields.end();
}

std::string headerValue(const testing::RecordedRequest& request, const std::string& name) {
    for (const auto& [key, value] : request.headers) {
        if (key == name) return value;
    }
    return "";
}

} // namespace

TEST_CASE("PageScraper - Successful fetch", "[PageScraper]") {
    auto session = std::make_shared<FakeHttpSession>();
    session->setHtml("https://example.com/members", kMembersPage);

    PageScraper scraper(session, auth::BrowsingContext(), makeAdapter(), testOptions());
    ScrapeOutcome outcome = scraper.fetchAndExtract("https://example.com/members", 1, "https://example.com/",
                                                    nullptr, common::CancellationToken());

    REQUIRE(outcome.success);
    REQUIRE(outcome.statusCode == 200);
    REQUIRE(outcome.page.url == "https://example.com/members");
    REQUIRE(outcome.page.finalUrl == "https://example.com/members");
    REQUIRE(outcome.page.title == "Members");
    REQUIRE(outcome.page.metadata.depth == 1);
    REQUIRE(outcome.page.metadata.parentUrl == "https://example.com/");
    REQUIRE(outcome.page.metadata.contentType == "public");
    REQUIRE_FALSE(outcome.formLoginAttempted);
}

TEST_CASE("PageScraper - Failures and retries", "[PageScraper]") {
    auto session = std::make_shared<FakeHttpSession>();
    PageScraper scraper(session, auth::BrowsingContext(), makeAdapter(), testOptions());

    SECTION("Temporary failure is retried") {
        FakeResponse unavailable;
        unavailable.statusCode = 503;
        session->queueResponse("https://example.com/flaky", unavailable);
        session->setHtml("https://example.com/flaky", kMembersPage);

        ScrapeOutcome outcome = scraper.fetchAndExtract("https://example.com/flaky", 0, "", nullptr,
                                                        common::CancellationToken());
        REQUIRE(outcome.success);
        REQUIRE(session->countRequests("GET", "https://example.com/flaky") == 2);
    }

    SECTION("Retries stop at the configured limit") {
        FakeResponse unavailable;
        unavailable.statusCode = 503;
        session->setPage("https://example.com/down", unavailable);

        ScrapeOutcome outcome = scraper.fetchAndExtract("https://example.com/down", 0, "", nullptr,
                                                        common::CancellationToken());
        REQUIRE_FALSE(outcome.success);
        REQUIRE(outcome.statusCode == 503);
        REQUIRE(outcome.failureType == FailureType::TEMPORARY);
        REQUIRE(session->countRequests("GET", "https://example.com/down") == 3);
    }

    SECTION("Not found is permanent and not retried") {
        ScrapeOutcome outcome = scraper.fetchAndExtract("https://example.com/missing", 0, "", nullptr,
                                                        common::CancellationToken());
        REQUIRE_FALSE(outcome.success);
        REQUIRE(outcome.statusCode == 404);
        REQUIRE(outcome.errorMessage == "HTTP 404");
        REQUIRE(outcome.failureType == FailureType::PERMANENT);
        REQUIRE(session->countRequests("GET", "https://example.com/missing") == 1);
    }

    SECTION("Unauthorized is an authentication failure") {
        FakeResponse denied;
        denied.statusCode = 401;
        session->setPage("https://example.com/private", denied);

        ScrapeOutcome outcome = scraper.fetchAndExtract("https://example.com/private", 0, "", nullptr,
                                                        common::CancellationToken());
        REQUIRE(outcome.failureType == FailureType::AUTHENTICATION);
        REQUIRE(session->countRequests("GET", "https://example.com/private") == 1);
    }

    SECTION("Non-HTML content is rejected") {
        FakeResponse pdf;
        pdf.contentType = "application/pdf";
        pdf.body = "%PDF-1.7";
        session->setPage("https://example.com/report.pdf", pdf);

        ScrapeOutcome outcome = scraper.fetchAndExtract("https://example.com/report.pdf", 0, "", nullptr,
                                                        common::CancellationToken());
        REQUIRE_FALSE(outcome.success);
        REQUIRE(outcome.failureType == FailureType::PERMANENT);
        REQUIRE(outcome.errorMessage == "Unsupported content type: application/pdf");
    }

    SECTION("Cancelled token aborts the fetch") {
        session->setHtml("https://example.com/members", kMembersPage);
        common::CancellationToken cancel;
        cancel.cancel();

        ScrapeOutcome outcome = scraper.fetchAndExtract("https://example.com/members", 0, "", nullptr, cancel);
        REQUIRE_FALSE(outcome.success);
        REQUIRE(outcome.errorMessage == "Request cancelled");
        REQUIRE(outcome.failureType == FailureType::TEMPORARY);
    }
}

TEST_CASE("PageScraper - Form login", "[PageScraper][auth]") {
    auto session = std::make_shared<FakeHttpSession>();
    auto adapter = makeAdapter();

    auth::FormAuth credential;
    credential.username = "alice";
    credential.password = "s3cret";
    auth::BrowsingContext context = adapter->prepare(auth::AuthConfig(credential), "https://example.com/");

    FakeResponse wall;
    wall.body = kLoginWall;
    session->queueResponse("https://example.com/members", wall);

    FakeResponse loggedIn;
    loggedIn.body = "<html><body>Welcome back</body></html>";
    loggedIn.setCookies = {"sid=abc; Path=/; HttpOnly"};
    loggedIn.finalUrl = "https://example.com/home";
    session->setPostResponse("https://example.com/session", loggedIn);

    SECTION("Login page is passed and the requested page is fetched again") {
        session->setHtml("https://example.com/members", kMembersPage);
        PageScraper scraper(session, context, adapter, testOptions());

        ScrapeOutcome outcome = scraper.fetchAndExtract("https://example.com/members", 0, "", nullptr,
                                                        common::CancellationToken());
        REQUIRE(outcome.success);
        REQUIRE(outcome.formLoginAttempted);
        REQUIRE(outcome.page.title == "Members");
        REQUIRE(outcome.page.metadata.contentType == "credential-based");

        REQUIRE(session->countRequests("POST", "https://example.com/session") == 1);
        const auto& requests = session->requests();
        auto post = std::find_if(requests.begin(), requests.end(),
                                 [](const testing::RecordedRequest& r) { return r.method == "POST"; });
        REQUIRE(post != requests.end());
        REQUIRE(hasField(post->fields, "username", "alice"));
        REQUIRE(hasField(post->fields, "password", "s3cret"));
        REQUIRE(hasField(post->fields, "csrf", "tok123"));

        // The session cookie from the login response rides along on the re-fetch
        REQUIRE(requests.back().method == "GET");
        REQUIRE(requests.back().url == "https://example.com/members");
        REQUIRE(headerValue(requests.back(), "Cookie") == "sid=abc");
    }

    SECTION("Login page shown again is an authentication failure") {
        session->setHtml("https://example.com/members", kLoginWall);
        PageScraper scraper(session, context, adapter, testOptions());

        ScrapeOutcome outcome = scraper.fetchAndExtract("https://example.com/members", 0, "", nullptr,
                                                        common::CancellationToken());
        REQUIRE_FALSE(outcome.success);
        REQUIRE(outcome.failureType == FailureType::AUTHENTICATION);
        REQUIRE(outcome.errorMessage == "Authentication failed - still on login page. Please check credentials.");
        REQUIRE(outcome.loginMethod == std::optional<std::string>("form"));
    }

    SECTION("Form login runs at most once per run") {
        session->setHtml("https://example.com/members", kMembersPage);
        session->queueResponse("https://example.com/other", wall);
        PageScraper scraper(session, context, adapter, testOptions());

        REQUIRE(scraper.fetchAndExtract("https://example.com/members", 0, "", nullptr,
                                        common::CancellationToken()).success);
        ScrapeOutcome second = scraper.fetchAndExtract("https://example.com/other", 1, "", nullptr,
                                                       common::CancellationToken());
        REQUIRE_FALSE(second.success);
        REQUIRE(second.failureType == FailureType::AUTHENTICATION);
        REQUIRE(session->countRequests("POST", "https://example.com/session") == 1);
    }
}

TEST_CASE("PageScraper - Login wall without a form credential", "[PageScraper][auth]") {
    auto session = std::make_shared<FakeHttpSession>();
    session->setHtml("https://example.com/members", kLoginWall);

    SECTION("Prompting enabled reports an authentication failure") {
        PageScraper scraper(session, auth::BrowsingContext(), makeAdapter(), testOptions());
        ScrapeOutcome outcome = scraper.fetchAndExtract("https://example.com/members", 0, "", nullptr,
                                                        common::CancellationToken());
        REQUIRE_FALSE(outcome.success);
        REQUIRE(outcome.failureType == FailureType::AUTHENTICATION);
        REQUIRE(outcome.loginMethod == std::optional<std::string>("form"));
        REQUIRE(outcome.errorMessage.find("Login page detected") == 0);
        REQUIRE(session->countRequests("POST", "https://example.com/session") == 0);
    }

    SECTION("Prompting disabled keeps the login page as content") {
        CrawlOptions options = testOptions();
        options.enableCredentialPrompting = false;
        PageScraper scraper(session, auth::BrowsingContext(), makeAdapter(), options);
        ScrapeOutcome outcome = scraper.fetchAndExtract("https://example.com/members", 0, "", nullptr,
                                                        common::CancellationToken());
        REQUIRE(outcome.success);
        REQUIRE(outcome.page.title == "Sign in");
    }
}

TEST_CASE("PageScraper - robots.txt", "[PageScraper]") {
    auto session = std::make_shared<FakeHttpSession>();
    PageScraper scraper(session, auth::BrowsingContext(), makeAdapter(), testOptions());

    SECTION("Body is returned when present") {
        FakeResponse robots;
        robots.contentType = "text/plain";
        robots.body = "User-agent: *\nDisallow: /admin/\n";
        session->setPage("https://example.com/robots.txt", robots);

        auto body = scraper.fetchRobotsTxt("https://example.com", common::CancellationToken());
        REQUIRE(body.has_value());
        REQUIRE(body->find("Disallow: /admin/") != std::string::npos);
    }

    SECTION("Missing robots.txt is nullopt") {
        REQUIRE_FALSE(scraper.fetchRobotsTxt("https://example.com", common::CancellationToken()).has_value());
    }
}

TEST_CASE("PageScraper - Construction", "[PageScraper]") {
    REQUIRE_THROWS_AS(PageScraper(nullptr, auth::BrowsingContext(), makeAdapter(), CrawlOptions()),
                      std::invalid_argument);
}
